#ifndef REQUEST_H_
#define REQUEST_H_

#include <string>
#include <nlohmann/json_fwd.hpp>
#include <codematic/submission.h>

// [A-Za-z0-9.]+, excluding "." and ".."
bool IsValidFilename(const std::string&);

// \n \t \r \\ \" \' \0 and \xHH; unknown escapes are kept verbatim
std::string DecodeEscapes(const std::string&);

// Request body:
//   {"sourceCodes": [...], "sourceCodeFilenames": [...],
//    "testCaseInputs": [...], "testCaseOutputs": [...],
//    "language": "c++17", "entryPoint": "main", "decodeEscapes": true}
// Returns false with a message for the caller if the body is malformed.
bool LoadSubmissionRequest(const nlohmann::json& data, Submission& sub, std::string& error);

#endif  // REQUEST_H_
