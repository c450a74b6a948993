#ifndef INCLUDE_CODEMATIC_ERRORS_H_
#define INCLUDE_CODEMATIC_ERRORS_H_

#include <string>
#include <vector>
#include <stdexcept>

#include <codematic/submission.h>

// cannot stage files; raised before any sandbox resource exists
class WorkspaceError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// the image was not produced; carries the filtered build log
class BuildFailed : public std::runtime_error {
  std::string log_;
 public:
  explicit BuildFailed(std::string log) :
      std::runtime_error("Image build failed"), log_(std::move(log)) {}
  const std::string& Log() const { return log_; }
};

// the engine could not schedule an instance
class LaunchError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// the engine could not be reached or answered something unexpected
class EngineError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

#define ENUM_FAILURE_REASON_ \
  X(WORKSPACE) \
  X(BUILD) \
  X(LAUNCH) \
  X(ENGINE) \
  X(INTERNAL)
enum class FailureReason {
#define X(name) name,
  ENUM_FAILURE_REASON_
#undef X
};

// What the caller of RunSubmission sees for any failure.
// Always raised after every resource of the run has been released.
class SubmissionFailed : public std::runtime_error {
  FailureReason reason_;
  std::string diagnostic_;
  std::vector<TestCaseResult> partial_results_;
 public:
  SubmissionFailed(FailureReason reason, const std::string& what, std::string diagnostic,
                   std::vector<TestCaseResult> partial_results) :
      std::runtime_error(what),
      reason_(reason),
      diagnostic_(std::move(diagnostic)),
      partial_results_(std::move(partial_results)) {}

  FailureReason Reason() const { return reason_; }
  // compiler output for BUILD, engine message otherwise
  const std::string& Diagnostic() const { return diagnostic_; }
  const std::vector<TestCaseResult>& PartialResults() const { return partial_results_; }
};

#endif  // INCLUDE_CODEMATIC_ERRORS_H_
