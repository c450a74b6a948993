#include <chrono>
#include <memory>
#include <fstream>
#include <iostream>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <nlohmann/json.hpp>
#include <codematic/logger.h>
#include <codematic/paths.h>
#include <codematic/pipeline.h>
#include <codematic/utils.h>

#include "codematic/container.h"
#include "docker_engine.h"
#include "json_reporter.h"
#include "request.h"

namespace {

constexpr std::chrono::milliseconds kPendingExecWait(5000);

fs::path request_file;
fs::path events_file;

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string workspace_root = ini[""]["workspace_root"] | "";
  std::string timeout_policy = ini[""]["timeout_policy"] | "";
  if (workspace_root.size()) kWorkspaceRoot = workspace_root;
  if (timeout_policy.size() && !GetTimeoutPolicy(timeout_policy, kTimeoutPolicy)) {
    spdlog::error("Unknown timeout policy {}", timeout_policy);
    return false;
  }
  kDockerSocket = ini[""]["docker_socket"] | kDockerSocket;
  kBaseImage = ini[""]["base_image"] | kBaseImage;
  kTestCaseTimeLimit = ini[""]["time_limit_ms"] | kTestCaseTimeLimit;
  kContainerMemoryLimit = ini[""]["memory_limit_mb"] | kContainerMemoryLimit;
  kContainerCpuLimit = ini[""]["cpu_limit"] | kContainerCpuLimit;
  kContainersPerSubmission = ini[""]["containers_per_submission"] | kContainersPerSubmission;
  kMaxBuildLogLength = (ini[""]["max_build_log_bytes"] | (long)kMaxBuildLogLength);
  return true;
}

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "codematic-judge");
  parser.add_argument("request")
    .help("Path of the submission request (JSON)");
  parser.add_argument("-c", "--config")
    .default_value(std::string(""))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-p", "--parallel")
    .scan<'d', int>()
    .help("Number of instances per submission");
  parser.add_argument("-t", "--time-limit")
    .scan<'d', long>()
    .help("Wall-clock limit per test case in milliseconds");
  parser.add_argument("--events")
    .default_value(std::string(""))
    .help("Write progress events as JSON lines to this file (- for stderr) instead of the log");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  InitLogger(verbosity);
  if (auto config_file = parser.get<std::string>("--config"); config_file.size()) {
    if (!ParseConfig(config_file)) {
      spdlog::error("Failed to parse configuration file {}", config_file);
      exit(1);
    }
  }
  if (auto val = parser.present<int>("--parallel")) {
    kContainersPerSubmission = val.value();
  }
  if (auto val = parser.present<long>("--time-limit")) {
    kTestCaseTimeLimit = val.value();
  }
  if (kContainersPerSubmission < 1) {
    spdlog::error("containers_per_submission must be positive");
    exit(1);
  }
  request_file = parser.get<std::string>("request");
  events_file = parser.get<std::string>("--events");
}

std::string Dump(const nlohmann::json& json) {
  return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace

int main(int argc, char** argv) {
  ParseArgs(argc, argv);

  Submission sub;
  {
    std::ifstream fin(request_file);
    if (!fin) {
      spdlog::error("Cannot open request {}", request_file.c_str());
      return 1;
    }
    nlohmann::json data;
    std::string error;
    try {
      fin >> data;
    } catch (nlohmann::json::exception& err) {
      spdlog::error("JSON decoding error: {}", err.what());
      return 1;
    }
    if (!LoadSubmissionRequest(data, sub, error)) {
      std::cout << Dump({{"status", "rejected"}, {"message", error}}) << std::endl;
      return 1;
    }
  }

  // progress goes to the log unless asked for as JSON lines; stdout carries only the result
  std::ofstream events_out;
  std::unique_ptr<Reporter> reporter;
  if (events_file == "-") {
    reporter = std::make_unique<JsonLinesReporter>(std::cerr);
  } else if (events_file.has_filename()) {
    events_out.open(events_file);
    if (!events_out) {
      spdlog::error("Cannot open events file {}", events_file.c_str());
      return 1;
    }
    reporter = std::make_unique<JsonLinesReporter>(events_out);
  } else {
    reporter = std::make_unique<LogReporter>();
  }
  Pipeline pipeline(std::make_shared<DockerEngine>(kDockerSocket), *reporter);
  int ret = 0;
  try {
    SubmissionResult res = pipeline.Run(sub);
    std::cout << Dump(SubmissionResultJSON(res)) << std::endl;
  } catch (SubmissionFailed& err) {
    std::cout << Dump(SubmissionFailedJSON(err)) << std::endl;
    ret = 2;
  }
  // abandoned execs end once their instances are gone; let them finish before static teardown
  if (!WaitPendingExecs(kPendingExecWait)) {
    spdlog::warn("{} execs still pending at exit", PendingExecs());
  }
  return ret;
}
