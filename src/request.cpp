#include "request.h"

#include <cctype>
#include <unordered_set>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <codematic/utils.h>

namespace {

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::vector<std::string> GetStrings(const nlohmann::json& data, const char* key, bool decode) {
  auto ret = data.at(key).get<std::vector<std::string>>();
  if (decode) {
    for (auto& str : ret) str = DecodeEscapes(str);
  }
  return ret;
}

} // namespace

bool IsValidFilename(const std::string& name) {
  if (name.empty() || name == "." || name == "..") return false;
  for (char c : name) {
    if (!std::isalnum((unsigned char)c) && c != '.') return false;
  }
  return true;
}

std::string DecodeEscapes(const std::string& str) {
  std::string ret;
  ret.reserve(str.size());
  for (size_t i = 0; i < str.size(); i++) {
    if (str[i] != '\\' || i + 1 == str.size()) {
      ret += str[i];
      continue;
    }
    char c = str[++i];
    switch (c) {
      case 'n': ret += '\n'; break;
      case 't': ret += '\t'; break;
      case 'r': ret += '\r'; break;
      case '0': ret += '\0'; break;
      case '\\': [[fallthrough]];
      case '"': [[fallthrough]];
      case '\'': ret += c; break;
      case 'x': {
        int hi = i + 1 < str.size() ? HexValue(str[i + 1]) : -1;
        int lo = i + 2 < str.size() ? HexValue(str[i + 2]) : -1;
        if (hi < 0 || lo < 0) {
          ret += "\\x";
          break;
        }
        ret += (char)(hi * 16 + lo);
        i += 2;
        break;
      }
      default: ret += '\\'; ret += c; break;
    }
  }
  return ret;
}

bool LoadSubmissionRequest(const nlohmann::json& data, Submission& sub, std::string& error) {
  using nlohmann::json;
  for (const char* key : {"sourceCodes", "sourceCodeFilenames", "testCaseInputs", "testCaseOutputs"}) {
    if (!data.contains(key)) {
      error = std::string("Missing field ") + key;
      return false;
    }
  }
  try {
    bool decode = data.value("decodeEscapes", true);
    auto codes = GetStrings(data, "sourceCodes", decode);
    auto filenames = data.at("sourceCodeFilenames").get<std::vector<std::string>>();
    auto inputs = GetStrings(data, "testCaseInputs", decode);
    auto outputs = GetStrings(data, "testCaseOutputs", decode);
    if (codes.size() != filenames.size()) {
      error = "Number of source codes differs from number of source code filenames";
      return false;
    }
    if (inputs.size() != outputs.size()) {
      error = "Number of test case inputs differs from number of test case outputs";
      return false;
    }
    std::unordered_set<std::string> seen;
    for (auto& name : filenames) {
      if (!IsValidFilename(name) || !seen.insert(name).second) {
        error = "Invalid filename: " + name;
        return false;
      }
    }
    std::string lang_name = data.value("language", std::string(LanguageName(Language::GCC_CPP_17)));
    if (!GetLanguage(lang_name, sub.lang)) {
      error = "Unsupported language: " + lang_name;
      return false;
    }
    sub.entry_point = data.value("entryPoint", std::string("main"));
    if (!IsValidFilename(sub.entry_point)) {
      error = "Invalid entry point: " + sub.entry_point;
      return false;
    }

    sub.source_files.clear();
    for (size_t i = 0; i < codes.size(); i++) {
      sub.source_files.push_back({filenames[i], std::move(codes[i])});
    }
    sub.test_cases.clear();
    for (size_t i = 0; i < inputs.size(); i++) {
      sub.test_cases.push_back({std::move(inputs[i]), std::move(outputs[i])});
    }
  } catch (json::exception& err) {
    spdlog::warn("Submission parsing error: {}", err.what());
    error = std::string("Malformed request: ") + err.what();
    return false;
  }
  return true;
}
