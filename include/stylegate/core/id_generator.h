#pragma once

#include <atomic>
#include <string>
#include <string_view>

namespace stylegate::core {

// Hands out trace ids ("trace-...") and audit event ids ("evt-...").
// Every id starts with "<prefix>-".
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;
  virtual std::string next(std::string_view prefix) = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

// "<prefix>-<epoch micros>-<sequence>". Safe to share between concurrent runs.
class SystemIdGenerator final : public IIdGenerator {
 public:
  std::string next(std::string_view prefix) override;

 private:
  std::atomic<unsigned long long> sequence_{0};
};

// "<prefix>-<sequence>" with one sequence shared by all prefixes, so a pipeline run
// that asks for a trace id and then five event ids gets trace-0, evt-1 ... evt-5.
class DeterministicIdGenerator final : public IIdGenerator {
 public:
  explicit DeterministicIdGenerator(unsigned long long first = 0) : sequence_(first) {}

  std::string next(std::string_view prefix) override;

 private:
  unsigned long long sequence_;
};

}  // namespace stylegate::core
