#ifndef INCLUDE_CODEMATIC_ENGINE_H_
#define INCLUDE_CODEMATIC_ENGINE_H_

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <functional>

#include <codematic/submission.h>

struct BuildLogLine {
  std::string text;
  bool is_error;
};

// The external sandboxing engine (image store + instance registry).
// Implementations must be callable from several threads at once; an exec abandoned
//   after a timeout keeps running on its own thread.
class SandboxEngine {
 public:
  using LineCallback = std::function<void(const BuildLogLine&)>;

  virtual ~SandboxEngine() = default;

  // Streams the build output line by line. Throws EngineError only if the request
  //   itself fails; a failed compile is not an error here.
  virtual void BuildImage(const std::filesystem::path& context, const std::string& descriptor,
                          const std::string& tag, const LineCallback& on_line) = 0;
  // image id, or nullopt if no image carries the tag
  virtual std::optional<std::string> FindImage(const std::string& tag) = 0;
  // forced; false if the image does not exist
  virtual bool RemoveImage(const std::string& tag) = 0;

  // detached, stdin held open; throws LaunchError
  virtual std::string StartContainer(const std::string& name, const std::string& image,
                                     const ResourceLimits& limits) = 0;
  // blocks until the command exits; combined stdout and stderr
  virtual std::string Exec(const std::string& handle, const std::vector<std::string>& command) = 0;
  // forced kill and removal; false if the instance does not exist
  virtual bool RemoveContainer(const std::string& handle) = 0;
};

#endif  // INCLUDE_CODEMATIC_ENGINE_H_
