#ifndef CODEMATIC_VERDICT_H_
#define CODEMATIC_VERDICT_H_

#include <string>
#include <codematic/submission.h>

// TIMED_OUT wins; otherwise exact byte comparison, no whitespace normalization.
TestCaseStatus Evaluate(const std::string& actual_output, const std::string& expected_output, bool timed_out);

#endif  // CODEMATIC_VERDICT_H_
