#include "container.h"

#include <mutex>
#include <future>
#include <condition_variable>
#include <thread>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <codematic/paths.h>
#include <codematic/errors.h>

long kTestCaseTimeLimit = 5000;
long kContainerMemoryLimit = 50;
double kContainerCpuLimit = 0.05;

namespace {

std::mutex pending_mtx;
std::condition_variable pending_cv;
size_t pending_execs = 0;

} // namespace

ResourceLimits ConfiguredLimits() {
  return {kContainerMemoryLimit, kContainerCpuLimit};
}

SandboxInstance StartInstance(SandboxEngine& engine, const std::string& name,
                              const std::string& image, const ResourceLimits& limits) {
  spdlog::debug("Start instance {} from {}: memory={}M cpus={}",
                name, image, limits.memory_mb, limits.cpus);
  SandboxInstance instance{name, "", limits};
  try {
    instance.handle = engine.StartContainer(name, image, limits);
  } catch (EngineError& err) {
    throw LaunchError(err.what());
  }
  spdlog::info("Instance started: name={} handle={}", name, instance.handle);
  return instance;
}

std::vector<std::string> TestCaseCommand(const std::string& entry_point, int index) {
  return {"sh", "-c", "./" + entry_point + " < " + TestCaseInputName(index)};
}

ExecResult ExecTestCase(const std::shared_ptr<SandboxEngine>& engine, const SandboxInstance& instance,
                        const std::string& entry_point, int index, std::chrono::milliseconds timeout) {
  auto command = TestCaseCommand(entry_point, index);
  spdlog::debug("Exec on {}: {}", instance.name, fmt::format("{}", command));
  auto promise = std::make_shared<std::promise<std::string>>();
  auto future = promise->get_future();
  {
    std::lock_guard lck(pending_mtx);
    pending_execs++;
  }
  // the thread keeps its own references; it may outlive this call
  std::thread([engine, handle = instance.handle, command = std::move(command), promise]() {
    try {
      promise->set_value(engine->Exec(handle, command));
    } catch (...) {
      promise->set_exception(std::current_exception());
    }
    std::lock_guard lck(pending_mtx);
    pending_execs--;
    pending_cv.notify_all();
  }).detach();
  if (future.wait_for(timeout) != std::future_status::ready) {
    spdlog::info("Exec timed out on {}: test case {} after {} ms", instance.name, index, timeout.count());
    return {"", true};
  }
  return {future.get(), false};
}

size_t PendingExecs() {
  std::lock_guard lck(pending_mtx);
  return pending_execs;
}

bool WaitPendingExecs(std::chrono::milliseconds timeout) {
  std::unique_lock lck(pending_mtx);
  return pending_cv.wait_for(lck, timeout, []() { return pending_execs == 0; });
}

bool StopInstance(SandboxEngine& engine, const std::string& handle) noexcept {
  try {
    spdlog::debug("Stop instance {}", handle);
    bool removed = engine.RemoveContainer(handle);
    if (!removed) spdlog::debug("Instance {} already gone", handle);
    return removed;
  } catch (std::exception& err) {
    spdlog::warn("Failed stopping instance {}: {}", handle, err.what());
    return false;
  }
}

bool RemoveImage(SandboxEngine& engine, const std::string& tag) noexcept {
  try {
    spdlog::debug("Remove image {}", tag);
    bool removed = engine.RemoveImage(tag);
    if (!removed) spdlog::debug("Image {} already gone", tag);
    return removed;
  } catch (std::exception& err) {
    spdlog::warn("Failed removing image {}: {}", tag, err.what());
    return false;
  }
}

const SandboxInstance& ScopedInstance::Start(const std::string& name, const std::string& image,
                                             const ResourceLimits& limits) {
  Release();
  name_ = name;
  image_ = image;
  limits_ = limits;
  instance_ = StartInstance(*engine_, name_, image_, limits_);
  return *instance_;
}

const SandboxInstance& ScopedInstance::Restart() {
  spdlog::info("Restarting instance {}", name_);
  StopInstance(*engine_, instance_ ? instance_->handle : name_);
  instance_.reset();
  instance_ = StartInstance(*engine_, name_, image_, limits_);
  return *instance_;
}

void ScopedInstance::Release() noexcept {
  if (name_.empty()) return;
  // the handle is unknown if the launch failed halfway; the engine accepts the name too
  StopInstance(*engine_, instance_ ? instance_->handle : name_);
  instance_.reset();
  name_.clear();
}
