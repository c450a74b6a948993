#ifndef CODEMATIC_UTILS_H_
#define CODEMATIC_UTILS_H_

#include <string>
#include <filesystem>

#include <codematic/utils.h>

namespace fs = std::filesystem;

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
bool WriteFile(const fs::path&, const std::string& content);

// keep at most max_len bytes, appending a marker if anything was dropped
std::string TruncateMessage(std::string&& message, size_t max_len, const char* what);

#endif  // CODEMATIC_UTILS_H_
