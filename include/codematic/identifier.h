#ifndef INCLUDE_CODEMATIC_IDENTIFIER_H_
#define INCLUDE_CODEMATIC_IDENTIFIER_H_

#include <string>

// Minted once per pipeline run; names the workspace, the image and every instance
//   of the run, so two runs never touch the same engine object.
class SubmissionId {
  std::string value_;

  explicit SubmissionId(std::string&& value) : value_(std::move(value)) {}
 public:
  static SubmissionId Generate();
  // only for tests and for restoring a known id
  static SubmissionId FromString(const std::string& value) { return SubmissionId(std::string(value)); }

  const std::string& str() const { return value_; }

  std::string ImageTag() const;
  std::string InstanceName(int slot) const;

  bool operator==(const SubmissionId& x) const { return value_ == x.value_; }
  bool operator!=(const SubmissionId& x) const { return value_ != x.value_; }
  bool operator<(const SubmissionId& x) const { return value_ < x.value_; }
};

#endif  // INCLUDE_CODEMATIC_IDENTIFIER_H_
