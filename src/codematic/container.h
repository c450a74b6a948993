#ifndef CODEMATIC_CONTAINER_H_
#define CODEMATIC_CONTAINER_H_

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <optional>

#include <codematic/engine.h>
#include <codematic/submission.h>

struct SandboxInstance {
  std::string name;
  std::string handle;
  ResourceLimits limits;
};

ResourceLimits ConfiguredLimits();

// throws LaunchError
SandboxInstance StartInstance(SandboxEngine& engine, const std::string& name,
                              const std::string& image, const ResourceLimits& limits);

// sh -c "./<entry> < test_case_<i>.in"
std::vector<std::string> TestCaseCommand(const std::string& entry_point, int index);

struct ExecResult {
  std::string output;
  bool timed_out;
};

// The exec runs on its own thread. If it has not finished when timeout elapses,
//   this returns timed_out = true with empty output and the exec is abandoned, not killed;
//   the result is then unknown, not cancelled.
// Engine errors of an exec that finished in time are rethrown.
ExecResult ExecTestCase(const std::shared_ptr<SandboxEngine>& engine, const SandboxInstance& instance,
                        const std::string& entry_point, int index, std::chrono::milliseconds timeout);

// exec threads that have not returned yet, abandoned ones included
size_t PendingExecs();
// false if some are still running when timeout elapses
bool WaitPendingExecs(std::chrono::milliseconds timeout);

// Both are idempotent, never throw and are safe on resources that are already gone.
bool StopInstance(SandboxEngine& engine, const std::string& handle) noexcept;
bool RemoveImage(SandboxEngine& engine, const std::string& tag) noexcept;

class ScopedInstance { // RAII instance
  std::shared_ptr<SandboxEngine> engine_;
  std::string name_, image_;
  ResourceLimits limits_;
  std::optional<SandboxInstance> instance_;
 public:
  explicit ScopedInstance(std::shared_ptr<SandboxEngine> engine) :
      engine_(std::move(engine)), limits_{} {}
  ~ScopedInstance() { Release(); }
  ScopedInstance(const ScopedInstance&) = delete;
  ScopedInstance& operator=(const ScopedInstance&) = delete;

  // the name is owned before the launch, so a half-started instance is still removed
  const SandboxInstance& Start(const std::string& name, const std::string& image,
                               const ResourceLimits& limits);
  // forced removal followed by a fresh start under the same name
  const SandboxInstance& Restart();
  bool Active() const { return !name_.empty(); }
  const SandboxInstance& Instance() const { return *instance_; }
  // idempotent
  void Release() noexcept;
};

#endif  // CODEMATIC_CONTAINER_H_
