#ifndef INCLUDE_CODEMATIC_UTILS_H_
#define INCLUDE_CODEMATIC_UTILS_H_

#include <string>

#include "errors.h"
#include "reporter.h"
#include "submission.h"

const char* LanguageName(Language);
// returns false if the language is not supported
bool GetLanguage(const std::string&, Language&);

const char* TestCaseStatusName(TestCaseStatus);
const char* TestCaseStatusDesc(TestCaseStatus);

const char* TimeoutPolicyName(TimeoutPolicy);
bool GetTimeoutPolicy(const std::string&, TimeoutPolicy&);

// logging
const char* PipelinePhaseName(PipelinePhase);
const char* FailureReasonName(FailureReason);

#endif  // INCLUDE_CODEMATIC_UTILS_H_
