#include "utils.h"

#include <cstring>
#include <fstream>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;

static const char* kLanguageNameTable[] = {
#define X(name, langname) langname,
  ENUM_LANGUAGE_
#undef X
};

const char* LanguageName(Language lang) {
  return kLanguageNameTable[(int)lang];
}

bool GetLanguage(const std::string& str, Language& lang) {
  for (size_t i = 0; i < sizeof(kLanguageNameTable) / sizeof(kLanguageNameTable[0]); i++) {
    if (str == kLanguageNameTable[i]) {
      lang = (Language)i;
      return true;
    }
  }
  return false;
}

#define X(...) X_RETURN_ARG1(TestCaseStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* TestCaseStatusName, TestCaseStatus, ENUM_TEST_CASE_STATUS_)
#undef X

#define X(...) X_RETURN_ARG2(TestCaseStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* TestCaseStatusDesc, TestCaseStatus, ENUM_TEST_CASE_STATUS_)
#undef X

static const char* kTimeoutPolicyTable[] = {
#define X(name, confname) confname,
  ENUM_TIMEOUT_POLICY_
#undef X
};

const char* TimeoutPolicyName(TimeoutPolicy policy) {
  return kTimeoutPolicyTable[(int)policy];
}

bool GetTimeoutPolicy(const std::string& str, TimeoutPolicy& policy) {
  for (size_t i = 0; i < sizeof(kTimeoutPolicyTable) / sizeof(kTimeoutPolicyTable[0]); i++) {
    if (str == kTimeoutPolicyTable[i]) {
      policy = (TimeoutPolicy)i;
      return true;
    }
  }
  return false;
}

#define X(...) X_RETURN_ARG1(PipelinePhase, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* PipelinePhaseName, PipelinePhase, ENUM_PIPELINE_PHASE_)
#undef X

#define X(...) X_RETURN_ARG1(FailureReason, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* FailureReasonName, FailureReason, ENUM_FAILURE_REASON_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool WriteFile(const fs::path& path, const std::string& content) {
  spdlog::debug("Write file {}, size {}", path.c_str(), content.size());
  std::ofstream fout(path, std::ios::binary | std::ios::trunc);
  if (!fout) goto err;
  fout.write(content.data(), content.size());
  fout.close();
  if (!fout) goto err;
  return true;
err:
  spdlog::warn("Failed writing {}: {}", path.c_str(), strerror(errno));
  return false;
}

std::string TruncateMessage(std::string&& message, size_t max_len, const char* what) {
  if (message.size() <= max_len) return std::move(message);
  message.resize(max_len);
  message += fmt::format("\n[{} truncated after {} bytes]", what, max_len);
  return std::move(message);
}
