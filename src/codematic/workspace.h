#ifndef CODEMATIC_WORKSPACE_H_
#define CODEMATIC_WORKSPACE_H_

#include <codematic/paths.h>
#include <codematic/submission.h>

// Creates a fresh directory for the run and writes every source file and every
//   test case input into it. Throws WorkspaceError; nothing is left behind on failure.
fs::path StageWorkspace(const SubmissionId& id, const Submission& sub);

// Tolerates a missing path and never throws; failures are only logged.
bool TeardownWorkspace(const fs::path& workspace) noexcept;

class ScopedWorkspace { // RAII workspace
  fs::path path_;
 public:
  ScopedWorkspace() {}
  ~ScopedWorkspace() { Release(); }
  ScopedWorkspace(const ScopedWorkspace&) = delete;
  ScopedWorkspace& operator=(const ScopedWorkspace&) = delete;

  void Stage(const SubmissionId& id, const Submission& sub);
  bool Active() const { return !path_.empty(); }
  const fs::path& Path() const { return path_; }
  // idempotent
  void Release() noexcept;
};

#endif  // CODEMATIC_WORKSPACE_H_
