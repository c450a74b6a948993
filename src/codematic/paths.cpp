#include <codematic/paths.h>

#include <string>

fs::path kWorkspaceRoot = "/tmp/codematic";

const char kDescriptorName[] = "codematic-build.dockerfile";
const char kInstanceWorkdir[] = "/usr/src/app";

fs::path WorkspacePath(const SubmissionId& id) {
  return kWorkspaceRoot / id.str();
}

fs::path WorkspaceSourceFile(const fs::path& workspace, const std::string& filename) {
  return workspace / filename;
}

std::string TestCaseInputName(int index) {
  return "test_case_" + std::to_string(index) + ".in";
}

fs::path WorkspaceTestCaseInput(const fs::path& workspace, int index) {
  return workspace / TestCaseInputName(index);
}

fs::path WorkspaceDescriptor(const fs::path& workspace) {
  return workspace / kDescriptorName;
}
