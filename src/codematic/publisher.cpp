#include "publisher.h"

#include <spdlog/spdlog.h>
#include "utils.h"

nlohmann::json ProgressEvent::ToJSON() const {
  return {
    {"type", PipelinePhaseName(type)},
    {"message", message},
    {"data", data.is_null() ? nlohmann::json::object() : data},
  };
}

void ProgressPublisher::Publish(PipelinePhase phase, const std::string& message, nlohmann::json data) noexcept {
  try {
    ProgressEvent event{phase, message, std::move(data)};
    spdlog::debug("Publish id={} phase={}: {}", id_.str(), PipelinePhaseName(phase), message);
    std::lock_guard lck(mtx_);
    reporter_.ReportEvent(event);
  } catch (std::exception& err) {
    spdlog::warn("Reporter failed on id={} phase={}: {}", id_.str(), PipelinePhaseName(phase), err.what());
  }
}
