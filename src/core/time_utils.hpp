#ifndef CAMLINK_CORE_TIME_UTILS_HPP_
#define CAMLINK_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace camlink::core {

// Every protocol timer runs on the monotonic clock. Callers pass `now`
// explicitly so the loop, tests and the simulator share one notion of time.
using MonotonicClock = std::chrono::steady_clock;
using TimePoint = MonotonicClock::time_point;
using Millis = std::chrono::milliseconds;

inline std::int64_t ToMillisCount(const Millis value) {
  return static_cast<std::int64_t>(value.count());
}

// Milliseconds elapsed between `since` and `now`, clamped at zero when the
// two points are out of order.
inline Millis ElapsedSince(const TimePoint since, const TimePoint now) {
  if (now <= since) {
    return Millis::zero();
  }
  return std::chrono::duration_cast<Millis>(now - since);
}

// Milliseconds since an arbitrary node-local origin, truncated to the 32-bit
// width carried in status payloads.
inline std::uint32_t ToWireMillis(const TimePoint origin, const TimePoint ts) {
  return static_cast<std::uint32_t>(ElapsedSince(origin, ts).count() & 0xFFFFFFFFLL);
}

// Canonical UTC timestamp formatter used by log lines and event streams.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm utc_time{};
#if defined(_WIN32)
  if (gmtime_s(&utc_time, &epoch_seconds) != 0) {
    return "";
  }
#else
  if (gmtime_r(&epoch_seconds, &utc_time) == nullptr) {
    return "";
  }
#endif

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

} // namespace camlink::core

#endif // CAMLINK_CORE_TIME_UTILS_HPP_
