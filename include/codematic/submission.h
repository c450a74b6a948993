#ifndef INCLUDE_CODEMATIC_SUBMISSION_H_
#define INCLUDE_CODEMATIC_SUBMISSION_H_

#include <string>
#include <vector>

#include <codematic/identifier.h>

// ms
extern long kTestCaseTimeLimit;
// MiB
extern long kContainerMemoryLimit;
// fraction of one core
extern double kContainerCpuLimit;
extern int kContainersPerSubmission;
extern std::string kBaseImage;
// bytes
extern size_t kMaxBuildLogLength;

#define ENUM_LANGUAGE_ \
  X(GCC_CPP_17, "c++17")
enum class Language {
#define X(name, langname) name,
  ENUM_LANGUAGE_
#undef X
};

#define ENUM_TEST_CASE_STATUS_ \
  X(PASSED, "passed") \
  X(FAILED, "failed") \
  X(TIMED_OUT, "timed out")
enum class TestCaseStatus {
#define X(name, desc) name,
  ENUM_TEST_CASE_STATUS_
#undef X
};

#define ENUM_TIMEOUT_POLICY_ \
  X(ABANDON, "abandon") /* leave the exec running until cleanup */ \
  X(RESTART, "restart") /* replace the instance that hosted it */
enum class TimeoutPolicy {
#define X(name, confname) name,
  ENUM_TIMEOUT_POLICY_
#undef X
};
extern TimeoutPolicy kTimeoutPolicy;

struct ResourceLimits {
  long memory_mb;
  double cpus;
};

class Submission {
 public:
  struct SourceFile {
    std::string filename;
    std::string content;
  };
  struct TestCase {
    std::string input;
    std::string expected_output;
  };

  // order is the compiler argument order
  std::vector<SourceFile> source_files;
  std::string entry_point;
  // order is the execution and reporting order
  std::vector<TestCase> test_cases;
  Language lang;

  Submission() : lang(Language::GCC_CPP_17) {}
};

struct TestCaseResult {
  int index;
  TestCaseStatus status;
  std::string actual_output; // empty if timed out
};

class SubmissionResult {
 public:
  SubmissionId id;
  std::vector<TestCaseResult> results;

  explicit SubmissionResult(const SubmissionId& id) : id(id) {}
};

#endif  // INCLUDE_CODEMATIC_SUBMISSION_H_
