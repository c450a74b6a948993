#include <gtest/gtest.h>
#include <codematic/utils.h>
#include "codematic/verdict.h"

namespace {

struct VerdictParam {
  std::string name;
  std::string actual, expected;
  bool timed_out;
  TestCaseStatus status;
};

std::string ParamName(const ::testing::TestParamInfo<VerdictParam>& info) {
  return info.param.name;
}

} // namespace

class EvaluateVerdict : public testing::TestWithParam<VerdictParam> {};
TEST_P(EvaluateVerdict, Status) {
  auto& param = GetParam();
  EXPECT_EQ(Evaluate(param.actual, param.expected, param.timed_out), param.status)
      << "got " << TestCaseStatusName(Evaluate(param.actual, param.expected, param.timed_out));
}
INSTANTIATE_TEST_SUITE_P(Verdict, EvaluateVerdict,
    testing::Values(
      VerdictParam{"exact", "9\n", "9\n", false, TestCaseStatus::PASSED},
      VerdictParam{"wrong_value", "8\n", "9\n", false, TestCaseStatus::FAILED},
      VerdictParam{"missing_newline", "9", "9\n", false, TestCaseStatus::FAILED},
      VerdictParam{"trailing_space", "9 \n", "9\n", false, TestCaseStatus::FAILED},
      VerdictParam{"crlf", "9\r\n", "9\n", false, TestCaseStatus::FAILED},
      VerdictParam{"both_empty", "", "", false, TestCaseStatus::PASSED},
      VerdictParam{"binary", std::string("a\0b", 3), std::string("a\0b", 3), false, TestCaseStatus::PASSED},
      VerdictParam{"binary_differs", std::string("a\0b", 3), "a", false, TestCaseStatus::FAILED},
      VerdictParam{"timeout_empty_expected", "", "", true, TestCaseStatus::TIMED_OUT},
      VerdictParam{"timeout_wins", "9\n", "9\n", true, TestCaseStatus::TIMED_OUT}
    ),
    ParamName);
