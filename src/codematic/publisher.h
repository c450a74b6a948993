#ifndef CODEMATIC_PUBLISHER_H_
#define CODEMATIC_PUBLISHER_H_

#include <mutex>
#include <string>

#include <codematic/reporter.h>
#include <codematic/identifier.h>

// Best-effort relay of phase transitions to a Reporter.
// Calls are serialized, so events reach the reporter in the order they were published.
class ProgressPublisher {
  Reporter& reporter_;
  const SubmissionId& id_;
  std::mutex mtx_;
 public:
  ProgressPublisher(Reporter& reporter, const SubmissionId& id) : reporter_(reporter), id_(id) {}

  // never throws
  void Publish(PipelinePhase phase, const std::string& message,
               nlohmann::json data = nlohmann::json::object()) noexcept;
};

#endif  // CODEMATIC_PUBLISHER_H_
