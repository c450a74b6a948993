#ifndef JSON_REPORTER_H_
#define JSON_REPORTER_H_

#include <mutex>
#include <ostream>

#include <codematic/errors.h>
#include <codematic/reporter.h>
#include <codematic/submission.h>

class LogReporter : public Reporter {
 public:
  void ReportEvent(const ProgressEvent&) override;
};

// one JSON object per line
class JsonLinesReporter : public Reporter {
  std::ostream& out_;
  std::mutex mtx_;
 public:
  explicit JsonLinesReporter(std::ostream& out) : out_(out) {}
  void ReportEvent(const ProgressEvent&) override;
};

nlohmann::json SubmissionResultJSON(const SubmissionResult&);
nlohmann::json SubmissionFailedJSON(const SubmissionFailed&);

#endif  // JSON_REPORTER_H_
