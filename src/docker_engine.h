#ifndef DOCKER_ENGINE_H_
#define DOCKER_ENGINE_H_

#include <memory>
#include <string>

#include <codematic/engine.h>

namespace httplib {
class Client;
} // namespace httplib

extern std::string kDockerSocket;

// SandboxEngine backed by the Docker Engine API on a unix socket.
// Every call opens its own connection, so calls from different threads never share one.
class DockerEngine : public SandboxEngine {
  std::string socket_path_;

  std::unique_ptr<httplib::Client> Connect_(time_t read_timeout_sec) const;
 public:
  explicit DockerEngine(const std::string& socket_path = kDockerSocket) : socket_path_(socket_path) {}

  void BuildImage(const std::filesystem::path& context, const std::string& descriptor,
                  const std::string& tag, const LineCallback& on_line) override;
  std::optional<std::string> FindImage(const std::string& tag) override;
  bool RemoveImage(const std::string& tag) override;

  std::string StartContainer(const std::string& name, const std::string& image,
                             const ResourceLimits& limits) override;
  std::string Exec(const std::string& handle, const std::vector<std::string>& command) override;
  bool RemoveContainer(const std::string& handle) override;
};

// exposed for testing; one line of the /build response stream
// Stream text is split into lines; an unterminated tail stays in partial until the next
//   message completes it or FlushBuildLine is called.
void ParseBuildMessage(const std::string& line, std::string& partial,
                       const SandboxEngine::LineCallback& on_line);
// emits what is left in partial as a final line
void FlushBuildLine(std::string& partial, const SandboxEngine::LineCallback& on_line);

// exposed for testing; consumes complete frames of a multiplexed exec stream from buf
//   and appends their payload to out
void DemuxExecStream(std::string& buf, std::string& out);

#endif  // DOCKER_ENGINE_H_
