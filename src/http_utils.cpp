#include "http_utils.h"

#include <fmt/format.h>

namespace http_utils {

std::string FormatOneParam(const char* str) {
  return str;
}
std::string FormatOneParam(const std::string& str) {
  // request bodies may be whole archives
  constexpr size_t kMaxLogLen = 256;
  if (str.size() > kMaxLogLen) return fmt::format("({} bytes)", str.size());
  return str;
}
std::string FormatOneParam(const httplib::Headers& headers) {
  return "";
}

std::string FormatParam() {
  return "(none)";
}

bool IsSuccess(int code) {
  return code >= 200 && code < 300;
}

} // namespace http_utils

bool IsSuccess(const httplib::Result& res) {
  return res && http_utils::IsSuccess(res->status);
}

std::string DescribeResult(const httplib::Result& res) {
  if (!res) return "request failed: " + httplib::to_string(res.error());
  return fmt::format("status {}: {}", res->status, res->body);
}
