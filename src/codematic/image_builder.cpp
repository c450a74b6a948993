#include "image_builder.h"

#include <regex>
#include <optional>
#include <exception>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <codematic/errors.h>
#include "container.h"
#include "utils.h"

size_t kMaxBuildLogLength = 4000;
std::string kBaseImage = "gcc:12";

namespace {

std::string StripLineEnd(const std::string& line) {
  size_t end = line.find_last_not_of("\r\n");
  return end == std::string::npos ? std::string() : line.substr(0, end + 1);
}

std::vector<std::string> SourceNames(const Submission& sub) {
  std::vector<std::string> ret;
  for (auto& file : sub.source_files) ret.push_back(file.filename);
  return ret;
}

} // namespace

std::vector<std::string> CompileCommand(Language lang, const std::vector<std::string>& sources,
                                        const std::string& entry_point) {
  std::string prog, std_flag;
  switch (lang) {
    case Language::GCC_CPP_17: prog = "g++", std_flag = "-std=c++17"; break;
  }
  std::vector<std::string> ret = {prog, std_flag, "-O2", "-o", entry_point};
  ret.insert(ret.end(), sources.begin(), sources.end());
  return ret;
}

std::string BuildDescriptor(Language lang, const std::vector<std::string>& sources,
                            const std::string& entry_point) {
  // exec form; the JSON array takes care of quoting
  nlohmann::json cmd = CompileCommand(lang, sources, entry_point);
  return fmt::format(
      "FROM {}\n"
      "COPY . {}\n"
      "WORKDIR {}\n"
      "RUN {}\n",
      kBaseImage, kInstanceWorkdir, kInstanceWorkdir, cmd.dump());
}

bool IsEngineFramingLine(const std::string& line) {
  static const std::regex kFramingRegex(
      "^\\s*$|"
      "^Step \\d+/\\d+ : |"
      "^ ---> |"
      "^Removing intermediate container|"
      "^Successfully built|"
      "^Successfully tagged");
  return std::regex_search(line, kFramingRegex);
}

BuildArtifact BuildSubmissionImage(SandboxEngine& engine, ProgressPublisher& publisher,
                                   const SubmissionId& id, const fs::path& workspace,
                                   const Submission& sub) {
  BuildArtifact artifact;
  artifact.image_tag = id.ImageTag();

  std::string descriptor = BuildDescriptor(sub.lang, SourceNames(sub), sub.entry_point);
  if (!WriteFile(WorkspaceDescriptor(workspace), descriptor)) {
    throw WorkspaceError("Cannot write build descriptor");
  }
  spdlog::debug("Build descriptor for id={}:\n{}", id.str(), descriptor);

  publisher.Publish(PipelinePhase::BUILDING_IMAGE, "Building image", {{"tag", artifact.image_tag}});
  std::string log;
  auto append = [&](const std::string& line) {
    if (!log.empty()) log += '\n';
    log += line;
  };
  // an engine error still resolves through the retrieval check below
  std::exception_ptr engine_error;
  try {
    engine.BuildImage(workspace, kDescriptorName, artifact.image_tag, [&](const BuildLogLine& item) {
      std::string line = StripLineEnd(item.text);
      if (!item.is_error && IsEngineFramingLine(line)) return;
      if (item.is_error) spdlog::info("Build error for id={}: {}", id.str(), line);
      append(line);
    });
  } catch (EngineError& err) {
    spdlog::warn("Build request failed for id={}: {}", id.str(), err.what());
    append(err.what());
    engine_error = std::current_exception();
  }

  // a compile failure never produces the tagged image; the stream ending cleanly means nothing
  std::optional<std::string> image_id;
  try {
    image_id = engine.FindImage(artifact.image_tag);
  } catch (EngineError& err) {
    spdlog::warn("Image lookup failed for id={}: {}", id.str(), err.what());
    if (!engine_error) {
      append(err.what());
      engine_error = std::current_exception();
    }
  }
  artifact.build_log = TruncateMessage(std::move(log), kMaxBuildLogLength, "Build log");
  if (!image_id) {
    spdlog::info("Image build failed: id={} tag={}", id.str(), artifact.image_tag);
    spdlog::debug("Build log: {}", artifact.build_log);
    publisher.Publish(PipelinePhase::IMAGE_BUILD_FAILED, "Image build failed",
                      {{"log", artifact.build_log}});
    if (engine_error) std::rethrow_exception(engine_error);
    throw BuildFailed(artifact.build_log);
  }
  artifact.image_id = *image_id;
  spdlog::info("Image built: id={} tag={} image={}", id.str(), artifact.image_tag, artifact.image_id);
  publisher.Publish(PipelinePhase::IMAGE_BUILT, "Image built successfully",
                    {{"tag", artifact.image_tag}, {"log", artifact.build_log}});
  return artifact;
}

const BuildArtifact& ScopedImage::Build(ProgressPublisher& publisher, const SubmissionId& id,
                                        const fs::path& workspace, const Submission& sub) {
  Release();
  tag_ = id.ImageTag();
  artifact_ = BuildSubmissionImage(*engine_, publisher, id, workspace, sub);
  return artifact_;
}

void ScopedImage::Release() noexcept {
  if (tag_.empty()) return;
  RemoveImage(*engine_, tag_);
  tag_.clear();
}
