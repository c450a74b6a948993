#ifndef INCLUDE_CODEMATIC_REPORTER_H_
#define INCLUDE_CODEMATIC_REPORTER_H_

#include <string>
#include <nlohmann/json.hpp>

// Every transition of a run produces exactly one event, in transition order.
#define ENUM_PIPELINE_PHASE_ \
  X(INITIALIZING) \
  X(WRITING_WORKSPACE) \
  X(BUILDING_IMAGE) \
  X(IMAGE_BUILT) \
  X(IMAGE_BUILD_FAILED) \
  X(STARTING_CONTAINER) \
  X(CONTAINER_RUNNING) \
  X(RUNNING_TEST_CASE) \
  X(TEST_CASE_FINISHED) \
  X(CLEANING_UP) \
  X(FINISHED) \
  X(FAILED)
enum class PipelinePhase {
#define X(name) name,
  ENUM_PIPELINE_PHASE_
#undef X
};

struct ProgressEvent {
  PipelinePhase type;
  std::string message;
  nlohmann::json data;

  nlohmann::json ToJSON() const;
};

class Reporter {
 public:
  virtual ~Reporter() = default;
  // this function should not block; exceptions are logged and dropped
  virtual void ReportEvent(const ProgressEvent&) {}
};

#endif  // INCLUDE_CODEMATIC_REPORTER_H_
