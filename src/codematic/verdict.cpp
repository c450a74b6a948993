#include "verdict.h"

TestCaseStatus Evaluate(const std::string& actual_output, const std::string& expected_output, bool timed_out) {
  if (timed_out) return TestCaseStatus::TIMED_OUT;
  return actual_output == expected_output ? TestCaseStatus::PASSED : TestCaseStatus::FAILED;
}
