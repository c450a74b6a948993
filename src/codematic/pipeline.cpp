#include <codematic/pipeline.h>

#include <atomic>
#include <algorithm>
#include <mutex>
#include <thread>
#include <optional>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "container.h"
#include "image_builder.h"
#include "publisher.h"
#include "verdict.h"
#include "workspace.h"
#include "utils.h"

int kContainersPerSubmission = 1;
TimeoutPolicy kTimeoutPolicy = TimeoutPolicy::ABANDON;

namespace {

using InstanceList = std::vector<std::unique_ptr<ScopedInstance>>;

int InstanceCount(const Submission& sub) {
  int count = std::min<long>(kContainersPerSubmission, sub.test_cases.size());
  return std::max(count, 1);
}

nlohmann::json ResultsJSON(const std::vector<TestCaseResult>& results) {
  nlohmann::json ret = nlohmann::json::array();
  for (auto& res : results) {
    ret.push_back({
      {"testCase", res.index},
      {"status", TestCaseStatusName(res.status)},
      {"output", res.actual_output},
    });
  }
  return ret;
}

// needs_restart carries a timed out exec over to the next test case of the same instance
TestCaseResult RunOneTestCase(const std::shared_ptr<SandboxEngine>& engine, const Submission& sub,
                              ProgressPublisher& publisher, ScopedInstance& instance,
                              int index, bool& needs_restart) {
  if (needs_restart) {
    instance.Restart();
    needs_restart = false;
  }
  publisher.Publish(PipelinePhase::RUNNING_TEST_CASE, fmt::format("Running test case {}", index),
                    {{"testCase", index}});
  ExecResult exec = ExecTestCase(engine, instance.Instance(), sub.entry_point, index,
                                 std::chrono::milliseconds(kTestCaseTimeLimit));
  TestCaseStatus status = Evaluate(exec.output, sub.test_cases[index].expected_output, exec.timed_out);
  spdlog::info("Test case finished: instance={} index={} status={}",
               instance.Instance().name, index, TestCaseStatusName(status));
  publisher.Publish(PipelinePhase::TEST_CASE_FINISHED,
                    fmt::format("Test case {} {}", index, TestCaseStatusDesc(status)),
                    {{"testCase", index}, {"status", TestCaseStatusName(status)}});
  if (exec.timed_out && kTimeoutPolicy == TimeoutPolicy::RESTART) needs_restart = true;
  return {index, status, std::move(exec.output)};
}

void RunSequential(const std::shared_ptr<SandboxEngine>& engine, const Submission& sub,
                   ProgressPublisher& publisher, ScopedInstance& instance,
                   std::vector<TestCaseResult>& results) {
  bool needs_restart = false;
  for (size_t i = 0; i < sub.test_cases.size(); i++) {
    results.push_back(RunOneTestCase(engine, sub, publisher, instance, i, needs_restart));
  }
}

// One worker per instance; each pulls the next index until none are left or one fails.
void RunParallel(const std::shared_ptr<SandboxEngine>& engine, const Submission& sub,
                 ProgressPublisher& publisher, InstanceList& instances,
                 std::vector<TestCaseResult>& results) {
  const size_t num = sub.test_cases.size();
  std::vector<std::optional<TestCaseResult>> slots(num);
  std::atomic_size_t next_index = 0;
  std::atomic_bool abort = false;
  std::mutex error_mtx;
  std::exception_ptr first_error;

  std::vector<std::thread> workers;
  for (auto& instance : instances) {
    workers.emplace_back([&, inst = instance.get()]() {
      bool needs_restart = false;
      while (!abort) {
        size_t index = next_index++;
        if (index >= num) break;
        try {
          slots[index] = RunOneTestCase(engine, sub, publisher, *inst, index, needs_restart);
        } catch (...) {
          std::lock_guard lck(error_mtx);
          if (!first_error) first_error = std::current_exception();
          abort = true;
        }
      }
    });
  }
  for (auto& worker : workers) worker.join();
  for (auto& slot : slots) {
    if (slot) results.push_back(std::move(*slot));
  }
  if (first_error) std::rethrow_exception(first_error);
}

SubmissionFailed ToSubmissionFailed(std::exception_ptr error, const std::vector<TestCaseResult>& partial) {
  try {
    std::rethrow_exception(error);
  } catch (BuildFailed& err) {
    return SubmissionFailed(FailureReason::BUILD, err.what(), err.Log(), partial);
  } catch (WorkspaceError& err) {
    return SubmissionFailed(FailureReason::WORKSPACE, "Cannot stage workspace", err.what(), partial);
  } catch (LaunchError& err) {
    return SubmissionFailed(FailureReason::LAUNCH, "Cannot start instance", err.what(), partial);
  } catch (EngineError& err) {
    return SubmissionFailed(FailureReason::ENGINE, "Sandbox engine error", err.what(), partial);
  } catch (std::exception& err) {
    return SubmissionFailed(FailureReason::INTERNAL, "Internal error", err.what(), partial);
  }
  __builtin_unreachable();
}

} // namespace

SubmissionResult Pipeline::Run(const Submission& sub) {
  const SubmissionId id = SubmissionId::Generate();
  ProgressPublisher publisher(reporter_, id);
  SubmissionResult result(id);

  // declared in acquisition order; each releases itself on every exit path
  ScopedWorkspace workspace;
  ScopedImage image(engine_);
  InstanceList instances;
  std::exception_ptr error;

  spdlog::info("Run submission: id={} lang={} sources={} test_cases={}", id.str(),
               LanguageName(sub.lang), sub.source_files.size(), sub.test_cases.size());
  publisher.Publish(PipelinePhase::INITIALIZING, "Initializing",
                    {{"submission", id.str()}, {"testCases", sub.test_cases.size()}});
  try {
    publisher.Publish(PipelinePhase::WRITING_WORKSPACE, "Writing workspace");
    workspace.Stage(id, sub);

    const BuildArtifact& artifact = image.Build(publisher, id, workspace.Path(), sub);

    int count = InstanceCount(sub);
    publisher.Publish(PipelinePhase::STARTING_CONTAINER, "Starting container", {{"containers", count}});
    for (int i = 0; i < count; i++) {
      instances.push_back(std::make_unique<ScopedInstance>(engine_));
      instances.back()->Start(id.InstanceName(i), artifact.image_id, ConfiguredLimits());
    }
    publisher.Publish(PipelinePhase::CONTAINER_RUNNING, "Container started", {{"containers", count}});

    if (instances.size() == 1) {
      RunSequential(engine_, sub, publisher, *instances[0], result.results);
    } else {
      RunParallel(engine_, sub, publisher, instances, result.results);
    }
  } catch (...) {
    error = std::current_exception();
  }

  publisher.Publish(PipelinePhase::CLEANING_UP, "Cleaning up");
  for (auto& instance : instances) instance->Release();
  image.Release();
  workspace.Release();

  if (error) {
    SubmissionFailed failed = ToSubmissionFailed(error, result.results);
    spdlog::info("Submission failed: id={} reason={}: {}", id.str(),
                 FailureReasonName(failed.Reason()), failed.Diagnostic());
    publisher.Publish(PipelinePhase::FAILED, failed.what(),
                      {{"reason", FailureReasonName(failed.Reason())},
                       {"diagnostic", failed.Diagnostic()},
                       {"results", ResultsJSON(failed.PartialResults())}});
    throw failed;
  }
  spdlog::info("Submission finished: id={}", id.str());
  publisher.Publish(PipelinePhase::FINISHED, "Finished", {{"results", ResultsJSON(result.results)}});
  return result;
}
