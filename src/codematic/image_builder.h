#ifndef CODEMATIC_IMAGE_BUILDER_H_
#define CODEMATIC_IMAGE_BUILDER_H_

#include <memory>
#include <string>
#include <vector>

#include <codematic/engine.h>
#include <codematic/paths.h>
#include <codematic/submission.h>
#include "publisher.h"

struct BuildArtifact {
  std::string image_tag; // what cleanup addresses
  std::string image_id;
  std::string build_log; // captured on success too
};

// source order is kept as argument order
std::vector<std::string> CompileCommand(Language lang, const std::vector<std::string>& sources,
                                        const std::string& entry_point);
std::string BuildDescriptor(Language lang, const std::vector<std::string>& sources,
                            const std::string& entry_point);

// step/layer markers and blank lines emitted by the engine itself
bool IsEngineFramingLine(const std::string& line);

// Writes the descriptor into the workspace and builds the image tagged id.ImageTag().
// Success means the tag resolves after the build stream ends.
// Throws BuildFailed or EngineError, both after publishing IMAGE_BUILD_FAILED, or WorkspaceError.
BuildArtifact BuildSubmissionImage(SandboxEngine& engine, ProgressPublisher& publisher,
                                   const SubmissionId& id, const fs::path& workspace,
                                   const Submission& sub);

class ScopedImage { // RAII image
  std::shared_ptr<SandboxEngine> engine_;
  std::string tag_;
  BuildArtifact artifact_;
 public:
  explicit ScopedImage(std::shared_ptr<SandboxEngine> engine) : engine_(std::move(engine)) {}
  ~ScopedImage() { Release(); }
  ScopedImage(const ScopedImage&) = delete;
  ScopedImage& operator=(const ScopedImage&) = delete;

  // the tag is owned before the build starts, so a half-built image is still removed
  const BuildArtifact& Build(ProgressPublisher& publisher, const SubmissionId& id,
                             const fs::path& workspace, const Submission& sub);
  bool Active() const { return !tag_.empty(); }
  const BuildArtifact& Artifact() const { return artifact_; }
  // idempotent
  void Release() noexcept;
};

#endif  // CODEMATIC_IMAGE_BUILDER_H_
