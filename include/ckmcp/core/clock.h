#pragma once

#include <chrono>
#include <mutex>
#include <string>

namespace ckmcp::core {

using TimePoint = std::chrono::steady_clock::time_point;

// Abstract clock interface for time injection.
// The engine pool orders entries by now(); status payloads report now_iso8601().
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Monotonic time, used only for ordering and durations.
  virtual TimePoint now() = 0;

  // Wall-clock timestamp in ISO 8601 format (UTC).
  virtual std::string now_iso8601() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: returns actual system time.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  TimePoint now() override;
  std::string now_iso8601() override;
};

// Manual clock: time only moves when advance() is called. Used by tests that need a
// deterministic least-recently-used order.
class ManualClock final : public IClock {
 public:
  explicit ManualClock(std::string fixed_time = "2026-01-01T00:00:00Z")
      : fixed_time_(std::move(fixed_time)) {}
  ~ManualClock() override = default;

  ManualClock(const ManualClock&) = delete;
  ManualClock& operator=(const ManualClock&) = delete;
  ManualClock(ManualClock&&) = delete;
  ManualClock& operator=(ManualClock&&) = delete;

  void advance(std::chrono::milliseconds delta);

  TimePoint now() override;
  std::string now_iso8601() override;

 private:
  std::mutex mutex_;
  TimePoint current_{};
  std::string fixed_time_;
};

}  // namespace ckmcp::core
