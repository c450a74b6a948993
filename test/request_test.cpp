#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "request.h"

using nlohmann::json;

namespace {

json SquareRequest() {
  return {
    {"sourceCodes", json::array({"#include <iostream>\\nint main() { long x; std::cin >> x; std::cout << x * x << '\\\\n'; }"})},
    {"sourceCodeFilenames", json::array({"main.cpp"})},
    {"testCaseInputs", {"3\\n", "4\\n"}},
    {"testCaseOutputs", {"9\\n", "16\\n"}},
  };
}

struct RejectParam {
  std::string name;
  json patch;
};

std::string ParamName(const ::testing::TestParamInfo<RejectParam>& info) {
  return info.param.name;
}

} // namespace

TEST(Filename, Charset) {
  EXPECT_TRUE(IsValidFilename("main.cpp"));
  EXPECT_TRUE(IsValidFilename("Util2.h"));
  EXPECT_TRUE(IsValidFilename("a"));
  EXPECT_FALSE(IsValidFilename(""));
  EXPECT_FALSE(IsValidFilename("."));
  EXPECT_FALSE(IsValidFilename(".."));
  EXPECT_FALSE(IsValidFilename("../etc"));
  EXPECT_FALSE(IsValidFilename("a/b.cpp"));
  EXPECT_FALSE(IsValidFilename("my file.cpp"));
  EXPECT_FALSE(IsValidFilename("main_2.cpp"));
  EXPECT_FALSE(IsValidFilename("-o"));
}

TEST(Escapes, Decode) {
  EXPECT_EQ(DecodeEscapes("3\\n"), "3\n");
  EXPECT_EQ(DecodeEscapes("a\\tb\\r\\n"), "a\tb\r\n");
  EXPECT_EQ(DecodeEscapes("\\\\n"), "\\n");
  EXPECT_EQ(DecodeEscapes("\\\"q\\'"), "\"q'");
  EXPECT_EQ(DecodeEscapes("\\x41\\x7a"), "Az");
  EXPECT_EQ(DecodeEscapes("a\\0b"), std::string("a\0b", 3));
  EXPECT_EQ(DecodeEscapes("\\q"), "\\q");
  EXPECT_EQ(DecodeEscapes("\\xg1"), "\\xg1");
  EXPECT_EQ(DecodeEscapes("end\\"), "end\\");
  EXPECT_EQ(DecodeEscapes("plain"), "plain");
}

TEST(LoadRequest, Defaults) {
  Submission sub;
  std::string error;
  ASSERT_TRUE(LoadSubmissionRequest(SquareRequest(), sub, error)) << error;
  EXPECT_EQ(sub.lang, Language::GCC_CPP_17);
  EXPECT_EQ(sub.entry_point, "main");
  ASSERT_EQ(sub.source_files.size(), 1u);
  EXPECT_EQ(sub.source_files[0].filename, "main.cpp");
  EXPECT_NE(sub.source_files[0].content.find("<iostream>\nint main"), std::string::npos);
  EXPECT_NE(sub.source_files[0].content.find("'\\n'"), std::string::npos);
  ASSERT_EQ(sub.test_cases.size(), 2u);
  EXPECT_EQ(sub.test_cases[0].input, "3\n");
  EXPECT_EQ(sub.test_cases[1].expected_output, "16\n");
}

TEST(LoadRequest, RawStrings) {
  json req = SquareRequest();
  req["decodeEscapes"] = false;
  req["entryPoint"] = "square";
  Submission sub;
  std::string error;
  ASSERT_TRUE(LoadSubmissionRequest(req, sub, error)) << error;
  EXPECT_EQ(sub.entry_point, "square");
  EXPECT_EQ(sub.test_cases[0].input, "3\\n");
}

TEST(LoadRequest, KeepsOrder) {
  json req = SquareRequest();
  req["sourceCodes"] = {"int b;", "int a;", "int main() {}"};
  req["sourceCodeFilenames"] = {"b.cpp", "a.cpp", "main.cpp"};
  Submission sub;
  std::string error;
  ASSERT_TRUE(LoadSubmissionRequest(req, sub, error)) << error;
  ASSERT_EQ(sub.source_files.size(), 3u);
  EXPECT_EQ(sub.source_files[0].filename, "b.cpp");
  EXPECT_EQ(sub.source_files[1].filename, "a.cpp");
  EXPECT_EQ(sub.source_files[2].content, "int main() {}");
}

class LoadRequestRejected : public testing::TestWithParam<RejectParam> {};
TEST_P(LoadRequestRejected, Reject) {
  json req = SquareRequest();
  req.merge_patch(GetParam().patch);
  Submission sub;
  std::string error;
  EXPECT_FALSE(LoadSubmissionRequest(req, sub, error));
  EXPECT_FALSE(error.empty());
}
INSTANTIATE_TEST_SUITE_P(Malformed, LoadRequestRejected,
    testing::Values(
      RejectParam{"missing_sources", {{"sourceCodes", nullptr}}},
      RejectParam{"missing_outputs", {{"testCaseOutputs", nullptr}}},
      RejectParam{"filename_count", {{"sourceCodeFilenames", {"main.cpp", "extra.cpp"}}}},
      RejectParam{"output_count", {{"testCaseOutputs", json::array({"9\\n"})}}},
      RejectParam{"bad_filename", {{"sourceCodeFilenames", json::array({"../main.cpp"})}}},
      RejectParam{"duplicate_filename", {{"sourceCodes", {"a", "b"}}, {"sourceCodeFilenames", {"x.cpp", "x.cpp"}}}},
      RejectParam{"language", {{"language", "python3"}}},
      RejectParam{"entry_point", {{"entryPoint", "bin/main"}}},
      RejectParam{"not_strings", {{"testCaseInputs", {1, 2}}}},
      RejectParam{"not_array", {{"sourceCodes", "int main() {}"}}}
    ),
    ParamName);
