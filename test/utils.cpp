#include "utils.h"

std::vector<PipelinePhase> CapturingReporter::Phases() {
  std::lock_guard lck(mtx_);
  std::vector<PipelinePhase> ret;
  for (auto& event : events_) ret.push_back(event.type);
  return ret;
}

size_t CapturingReporter::Count(PipelinePhase phase) {
  std::lock_guard lck(mtx_);
  size_t ret = 0;
  for (auto& event : events_) ret += event.type == phase;
  return ret;
}

Submission SquareSubmission(const std::vector<std::pair<std::string, std::string>>& tests) {
  Submission sub;
  sub.source_files = {
    {"main.cpp", "#include \"square.h\"\n#include <iostream>\n"
                 "int main() { long x; std::cin >> x; std::cout << Square(x) << '\\n'; }\n"},
    {"square.h", "inline long Square(long x) { return x * x; }\n"},
  };
  sub.entry_point = "main";
  for (auto& [input, output] : tests) sub.test_cases.push_back({input, output});
  return sub;
}

std::optional<std::string> SquareProgram(const std::string& input) {
  long x = std::stol(input);
  return std::to_string(x * x) + "\n";
}

ConfigGuard::ConfigGuard() :
    time_limit_(kTestCaseTimeLimit),
    memory_limit_(kContainerMemoryLimit),
    cpu_limit_(kContainerCpuLimit),
    containers_(kContainersPerSubmission),
    policy_(kTimeoutPolicy),
    max_build_log_(kMaxBuildLogLength),
    base_image_(kBaseImage) {}

ConfigGuard::~ConfigGuard() {
  kTestCaseTimeLimit = time_limit_;
  kContainerMemoryLimit = memory_limit_;
  kContainerCpuLimit = cpu_limit_;
  kContainersPerSubmission = containers_;
  kTimeoutPolicy = policy_;
  kMaxBuildLogLength = max_build_log_;
  kBaseImage = base_image_;
}
