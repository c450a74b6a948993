#ifndef INCLUDE_CODEMATIC_PATHS_H_
#define INCLUDE_CODEMATIC_PATHS_H_

#include <filesystem>

#include <codematic/identifier.h>

namespace fs = std::filesystem;

extern fs::path kWorkspaceRoot;

fs::path WorkspacePath(const SubmissionId& id);
fs::path WorkspaceSourceFile(const fs::path& workspace, const std::string& filename);
fs::path WorkspaceTestCaseInput(const fs::path& workspace, int index);
fs::path WorkspaceDescriptor(const fs::path& workspace);

// names as seen from inside the instance
std::string TestCaseInputName(int index);
extern const char kDescriptorName[];
extern const char kInstanceWorkdir[];

#endif  // INCLUDE_CODEMATIC_PATHS_H_
