#include "json_reporter.h"

#include <spdlog/spdlog.h>
#include <codematic/utils.h>

namespace {

nlohmann::json TestCaseResultsJSON(const std::vector<TestCaseResult>& results) {
  nlohmann::json ret = nlohmann::json::array();
  for (auto& res : results) {
    ret.push_back({
      {"index", res.index},
      {"status", TestCaseStatusName(res.status)},
      {"actualOutput", res.actual_output},
    });
  }
  return ret;
}

} // namespace

void LogReporter::ReportEvent(const ProgressEvent& event) {
  spdlog::info("[{}] {} {}", PipelinePhaseName(event.type), event.message,
               event.data.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

void JsonLinesReporter::ReportEvent(const ProgressEvent& event) {
  std::string line = event.ToJSON().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  std::lock_guard lck(mtx_);
  out_ << line << std::endl;
}

nlohmann::json SubmissionResultJSON(const SubmissionResult& res) {
  return {
    {"submission", res.id.str()},
    {"status", "success"},
    {"results", TestCaseResultsJSON(res.results)},
  };
}

nlohmann::json SubmissionFailedJSON(const SubmissionFailed& err) {
  return {
    {"status", "failed"},
    {"reason", FailureReasonName(err.Reason())},
    {"message", err.what()},
    {"diagnostic", err.Diagnostic()},
    {"results", TestCaseResultsJSON(err.PartialResults())},
  };
}
