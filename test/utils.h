#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>
#include <codematic/reporter.h>
#include <codematic/submission.h>

class CapturingReporter : public Reporter {
  std::mutex mtx_;
  std::vector<ProgressEvent> events_;
 public:
  void ReportEvent(const ProgressEvent& event) override {
    std::lock_guard lck(mtx_);
    events_.push_back(event);
  }
  std::vector<ProgressEvent> Events() {
    std::lock_guard lck(mtx_);
    return events_;
  }
  std::vector<PipelinePhase> Phases();
  size_t Count(PipelinePhase phase);
};

class ThrowingReporter : public Reporter {
 public:
  void ReportEvent(const ProgressEvent&) override {
    throw std::runtime_error("reporter is gone");
  }
};

// main.cpp + one header; the program squares the integer it reads
Submission SquareSubmission(const std::vector<std::pair<std::string, std::string>>& tests);

// the fake engine's rendition of the compiled square program
std::optional<std::string> SquareProgram(const std::string& input);

// saves the tunables a test may change and restores them afterwards
class ConfigGuard {
  long time_limit_, memory_limit_;
  double cpu_limit_;
  int containers_;
  TimeoutPolicy policy_;
  size_t max_build_log_;
  std::string base_image_;
 public:
  ConfigGuard();
  ~ConfigGuard();
};

#endif // TEST_UTILS_H_
