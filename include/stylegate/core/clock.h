#pragma once

#include <chrono>
#include <string>
#include <utility>

namespace stylegate::core {

// "YYYY-MM-DDTHH:MM:SSZ", second precision, always UTC.
std::string format_iso8601_utc(std::chrono::system_clock::time_point at);

// Source of audit event timestamps.
class IClock {
 public:
  virtual ~IClock() = default;
  virtual std::string now_iso8601() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

class SystemClock final : public IClock {
 public:
  std::string now_iso8601() override { return format_iso8601_utc(std::chrono::system_clock::now()); }
};

// Every styling run stamped by a FixedClock carries the same created_at.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::string stamp) : stamp_(std::move(stamp)) {}
  explicit FixedClock(std::chrono::system_clock::time_point at) : stamp_(format_iso8601_utc(at)) {}

  std::string now_iso8601() override { return stamp_; }

 private:
  std::string stamp_;
};

}  // namespace stylegate::core
