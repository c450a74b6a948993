#include "workspace.h"

#include <cstring>

#include <spdlog/spdlog.h>
#include <codematic/errors.h>
#include "utils.h"

namespace {

void WriteOrThrow(const fs::path& workspace, const fs::path& path, const std::string& content) {
  if (!WriteFile(path, content)) {
    TeardownWorkspace(workspace);
    throw WorkspaceError("Cannot write " + path.string());
  }
}

} // namespace

fs::path StageWorkspace(const SubmissionId& id, const Submission& sub) {
  fs::path workspace = WorkspacePath(id);
  if (!CreateDirs(kWorkspaceRoot)) {
    throw WorkspaceError("Cannot create workspace root " + kWorkspaceRoot.string());
  }
  std::error_code ec;
  // create_directory reports false on an existing path; ids are unique so that is an error too
  if (!fs::create_directory(workspace, ec)) {
    spdlog::warn("Failed creating workspace {}: {}", workspace.c_str(),
                 ec ? strerror(ec.value()) : "already exists");
    throw WorkspaceError("Cannot create workspace " + workspace.string());
  }
  spdlog::debug("Staging workspace {}: {} sources, {} test cases",
                workspace.c_str(), sub.source_files.size(), sub.test_cases.size());
  for (auto& file : sub.source_files) {
    WriteOrThrow(workspace, WorkspaceSourceFile(workspace, file.filename), file.content);
  }
  for (size_t i = 0; i < sub.test_cases.size(); i++) {
    WriteOrThrow(workspace, WorkspaceTestCaseInput(workspace, i), sub.test_cases[i].input);
  }
  return workspace;
}

bool TeardownWorkspace(const fs::path& workspace) noexcept {
  if (workspace.empty()) return false;
  return RemoveAll(workspace);
}

void ScopedWorkspace::Stage(const SubmissionId& id, const Submission& sub) {
  Release();
  path_ = StageWorkspace(id, sub);
}

void ScopedWorkspace::Release() noexcept {
  if (path_.empty()) return;
  TeardownWorkspace(path_);
  path_.clear();
}
