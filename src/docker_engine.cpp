#include "docker_engine.h"

#include <sys/socket.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <codematic/errors.h>

#include "archive.h"
#include "http_utils.h"

std::string kDockerSocket = "/var/run/docker.sock";

namespace {

constexpr time_t kRequestTimeout = 60; // s
constexpr time_t kBuildTimeout = 1800; // s
// an abandoned exec is only released by removing its instance
constexpr time_t kExecTimeout = 86400; // s
constexpr size_t kMaxExecOutput = 64 * 1024 * 1024;

const char kJSONType[] = "application/json";

std::string ErrorMessage(const httplib::Result& res) {
  if (res) {
    try {
      auto body = nlohmann::json::parse(res->body);
      if (auto it = body.find("message"); it != body.end() && it->is_string()) {
        return fmt::format("status {}: {}", res->status, it->get<std::string>());
      }
    } catch (nlohmann::json::exception& err) {
      spdlog::debug("Error body is not JSON: {}", err.what());
    }
  }
  return DescribeResult(res);
}

} // namespace

void ParseBuildMessage(const std::string& line, std::string& partial,
                       const SandboxEngine::LineCallback& on_line) {
  using nlohmann::json;
  if (line.find_first_not_of(" \t\r\n") == std::string::npos) return;
  json msg;
  try {
    msg = json::parse(line);
  } catch (json::exception& err) {
    spdlog::warn("Build stream decoding error: {}", err.what());
    return;
  }
  if (auto it = msg.find("stream"); it != msg.end() && it->is_string()) {
    // the engine forwards output in write-sized chunks, not lines
    partial += it->get<std::string>();
    size_t start = 0, end;
    while ((end = partial.find('\n', start)) != std::string::npos) {
      on_line({partial.substr(start, end - start), false});
      start = end + 1;
    }
    partial.erase(0, start);
    return;
  }
  if (auto it = msg.find("error"); it != msg.end() && it->is_string()) {
    FlushBuildLine(partial, on_line);
    on_line({it->get<std::string>(), true});
  } else if (auto it = msg.find("errorDetail"); it != msg.end() && it->is_object()) {
    FlushBuildLine(partial, on_line);
    on_line({it->value("message", std::string("unknown build error")), true});
  } else {
    // aux (image id) and pull progress
    spdlog::debug("Build stream: {}", line);
  }
}

void FlushBuildLine(std::string& partial, const SandboxEngine::LineCallback& on_line) {
  if (partial.empty()) return;
  on_line({partial, false});
  partial.clear();
}

void DemuxExecStream(std::string& buf, std::string& out) {
  constexpr size_t kHeaderSize = 8;
  size_t pos = 0;
  while (buf.size() - pos >= kHeaderSize) {
    const unsigned char* header = reinterpret_cast<const unsigned char*>(buf.data() + pos);
    size_t len = (size_t)header[4] << 24 | (size_t)header[5] << 16 | (size_t)header[6] << 8 | header[7];
    if (buf.size() - pos - kHeaderSize < len) break;
    // 1 = stdout, 2 = stderr; both are kept, in arrival order
    if (header[0] == 1 || header[0] == 2) out.append(buf, pos + kHeaderSize, len);
    pos += kHeaderSize + len;
  }
  buf.erase(0, pos);
}

std::unique_ptr<httplib::Client> DockerEngine::Connect_(time_t read_timeout_sec) const {
  auto cli = std::make_unique<httplib::Client>(socket_path_);
  cli->set_address_family(AF_UNIX);
  cli->set_default_headers({{"Host", "docker"}});
  cli->set_connection_timeout(kRequestTimeout);
  cli->set_read_timeout(read_timeout_sec);
  cli->set_write_timeout(kRequestTimeout);
  return cli;
}

void DockerEngine::BuildImage(const std::filesystem::path& context, const std::string& descriptor,
                              const std::string& tag, const LineCallback& on_line) {
  std::string archive;
  if (!MakeTarArchive(context, archive)) {
    throw EngineError("Cannot archive build context " + context.string());
  }
  auto cli = Connect_(kBuildTimeout);
  httplib::Request req;
  req.method = "POST";
  req.path = fmt::format("/build?t={}&dockerfile={}&rm=1&forcerm=1", tag, descriptor);
  req.headers = {{"Content-Type", "application/x-tar"}};
  req.body = std::move(archive);
  std::string pending, partial, last_message;
  req.content_receiver = [&](const char* data, size_t len, uint64_t, uint64_t) {
    pending.append(data, len);
    size_t pos;
    while ((pos = pending.find('\n')) != std::string::npos) {
      last_message = pending.substr(0, pos);
      ParseBuildMessage(last_message, partial, on_line);
      pending.erase(0, pos + 1);
    }
    return true;
  };
  spdlog::debug("POST {} context {} ({} bytes)", req.path, context.c_str(), req.body.size());
  auto res = cli->send(req);
  if (!IsSuccess(res)) {
    FlushBuildLine(partial, on_line);
    // error bodies are delivered through the receiver as well
    throw EngineError(fmt::format("Build request failed: {} {}", DescribeResult(res),
                                  pending.empty() ? last_message : pending));
  }
  if (!pending.empty()) ParseBuildMessage(pending, partial, on_line);
  FlushBuildLine(partial, on_line);
}

std::optional<std::string> DockerEngine::FindImage(const std::string& tag) {
  auto cli = Connect_(kRequestTimeout);
  auto res = HTTPRequest<HTTPGet>(*cli, fmt::format("/images/{}/json", tag));
  if (res && res->status == 404) return std::nullopt;
  if (!IsSuccess(res)) throw EngineError("Image inspection failed: " + ErrorMessage(res));
  try {
    return nlohmann::json::parse(res->body).at("Id").get<std::string>();
  } catch (nlohmann::json::exception& err) {
    throw EngineError(fmt::format("Unexpected image inspection response: {}", err.what()));
  }
}

bool DockerEngine::RemoveImage(const std::string& tag) {
  auto cli = Connect_(kRequestTimeout);
  auto res = HTTPRequest<HTTPDelete>(*cli, fmt::format("/images/{}?force=1", tag));
  if (res && res->status == 404) return false;
  if (!IsSuccess(res)) throw EngineError("Image removal failed: " + ErrorMessage(res));
  return true;
}

std::string DockerEngine::StartContainer(const std::string& name, const std::string& image,
                                         const ResourceLimits& limits) {
  using nlohmann::json;
  auto cli = Connect_(kRequestTimeout);
  long memory = limits.memory_mb * 1024 * 1024;
  json body{
    {"Image", image},
    {"Cmd", json::array({"sh"})},
    {"OpenStdin", true},
    {"AttachStdin", false},
    {"Tty", true},
    {"NetworkDisabled", true},
    {"HostConfig", {
      {"Memory", memory},
      {"MemorySwap", memory},
      {"NanoCpus", (long)(limits.cpus * 1e9)},
    }},
  };
  auto res = HTTPRequest<HTTPPost>(*cli, fmt::format("/containers/create?name={}", name),
                                   body.dump(), kJSONType);
  if (!IsSuccess(res)) throw LaunchError("Cannot create instance: " + ErrorMessage(res));
  std::string handle;
  try {
    handle = json::parse(res->body).at("Id").get<std::string>();
  } catch (json::exception& err) {
    throw LaunchError(fmt::format("Unexpected create response: {}", err.what()));
  }
  auto start_res = HTTPRequest<HTTPPost>(*cli, fmt::format("/containers/{}/start", handle), "", kJSONType);
  // 304: already started
  if (!IsSuccess(start_res) && !(start_res && start_res->status == 304)) {
    throw LaunchError("Cannot start instance: " + ErrorMessage(start_res));
  }
  return handle;
}

std::string DockerEngine::Exec(const std::string& handle, const std::vector<std::string>& command) {
  using nlohmann::json;
  std::string exec_id;
  {
    auto cli = Connect_(kRequestTimeout);
    json body{
      {"AttachStdin", false},
      {"AttachStdout", true},
      {"AttachStderr", true},
      {"Tty", false},
      {"Cmd", command},
    };
    auto res = HTTPRequest<HTTPPost>(*cli, fmt::format("/containers/{}/exec", handle),
                                     body.dump(), kJSONType);
    if (!IsSuccess(res)) throw EngineError("Cannot create exec: " + ErrorMessage(res));
    try {
      exec_id = json::parse(res->body).at("Id").get<std::string>();
    } catch (json::exception& err) {
      throw EngineError(fmt::format("Unexpected exec response: {}", err.what()));
    }
  }
  auto cli = Connect_(kExecTimeout);
  httplib::Request req;
  req.method = "POST";
  req.path = fmt::format("/exec/{}/start", exec_id);
  req.headers = {{"Content-Type", kJSONType}};
  req.body = json{{"Detach", false}, {"Tty", false}}.dump();
  std::string pending, output;
  bool truncated = false;
  req.content_receiver = [&](const char* data, size_t len, uint64_t, uint64_t) {
    pending.append(data, len);
    DemuxExecStream(pending, output);
    if (output.size() > kMaxExecOutput) {
      output.resize(kMaxExecOutput);
      truncated = true;
      return false;
    }
    return true;
  };
  spdlog::debug("POST {} on {}", req.path, handle);
  auto res = cli->send(req);
  if (truncated) {
    spdlog::info("Exec output on {} truncated after {} bytes", handle, kMaxExecOutput);
    return output;
  }
  if (!IsSuccess(res)) throw EngineError("Exec failed: " + DescribeResult(res));
  return output;
}

bool DockerEngine::RemoveContainer(const std::string& handle) {
  auto cli = Connect_(kRequestTimeout);
  auto res = HTTPRequest<HTTPDelete>(*cli, fmt::format("/containers/{}?force=1", handle));
  if (res && res->status == 404) return false;
  if (!IsSuccess(res)) throw EngineError("Instance removal failed: " + ErrorMessage(res));
  return true;
}
