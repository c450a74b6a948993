#ifndef INCLUDE_CODEMATIC_PIPELINE_H_
#define INCLUDE_CODEMATIC_PIPELINE_H_

#include <memory>

#include "engine.h"
#include "errors.h"
#include "reporter.h"
#include "submission.h"

// Builds a submission into an image, runs every test case inside resource-capped
//   instances of it and reports each phase transition to the reporter.
//
// Runs are independent: each one mints its own SubmissionId, so several Run() calls may
//   proceed concurrently on the same Pipeline as long as the reporter tolerates it.
class Pipeline {
  std::shared_ptr<SandboxEngine> engine_;
  Reporter& reporter_;
 public:
  Pipeline(std::shared_ptr<SandboxEngine> engine, Reporter& reporter) :
      engine_(std::move(engine)), reporter_(reporter) {}

  // One result per test case, in submission order. Throws SubmissionFailed; in every case
  //   the instances, the image and the workspace are gone before this returns.
  SubmissionResult Run(const Submission& sub);
};

#endif  // INCLUDE_CODEMATIC_PIPELINE_H_
