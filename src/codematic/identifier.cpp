#include <codematic/identifier.h>

#include <unistd.h>
#include <atomic>
#include <random>

#include <fmt/format.h>

namespace {

std::atomic_long submission_seq = 0;

uint32_t RandomSuffix() {
  thread_local std::mt19937 gen(std::random_device{}());
  return gen();
}

} // namespace

SubmissionId SubmissionId::Generate() {
  // docker tags only allow lowercase [a-z0-9._-]
  return SubmissionId(fmt::format("{}-{}-{:08x}", getpid(), ++submission_seq, RandomSuffix()));
}

std::string SubmissionId::ImageTag() const {
  return "codematic-" + value_;
}

std::string SubmissionId::InstanceName(int slot) const {
  return fmt::format("codematic-{}-{}", value_, slot);
}
