#include "ckmcp/core/clock.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace ckmcp::core {

TimePoint SystemClock::now() {
  return std::chrono::steady_clock::now();
}

std::string SystemClock::now_iso8601() {
  const auto now = std::chrono::system_clock::now();
  const auto time_t_now = std::chrono::system_clock::to_time_t(now);

  std::tm utc{};
  gmtime_r(&time_t_now, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

void ManualClock::advance(std::chrono::milliseconds delta) {
  std::lock_guard<std::mutex> lock(mutex_);
  current_ += delta;
}

TimePoint ManualClock::now() {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_;
}

std::string ManualClock::now_iso8601() {
  return fixed_time_;
}

}  // namespace ckmcp::core
