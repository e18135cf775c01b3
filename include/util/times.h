#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

using SysClock = std::chrono::system_clock;
using SysTimePoint = std::chrono::sys_time<std::chrono::seconds>;

using LocalTimePoint = std::chrono::local_time<std::chrono::seconds>;

using milliseconds = std::chrono::milliseconds;
using seconds = std::chrono::seconds;
using minutes = std::chrono::minutes;
using hours = std::chrono::hours;
using days = std::chrono::days;

inline constexpr minutes H_4{hours{4}}, D_1{hours{24}};

inline SysTimePoint from_unix_seconds(int64_t secs) {
  return SysTimePoint{seconds{secs}};
}

inline SysTimePoint from_unix_millis(int64_t ms) {
  return std::chrono::floor<seconds>(
      std::chrono::sys_time<milliseconds>{milliseconds{ms}});
}

LocalTimePoint now_local_time();

// "YYYY-MM-DD HH:MM:SS"
std::string datetime_to_string(LocalTimePoint tp);
std::string datetime_to_string(SysTimePoint tp);

LocalTimePoint datetime_to_local(std::string_view datetime,
                                 std::string_view fmt = "%F %T");

std::string interval_to_str(minutes interval);

struct Timer {
  TimePoint start;
  Timer() : start{Clock::now()} {}
  double diff_ms() const {
    return std::chrono::duration<double, std::milli>(Clock::now() - start)
        .count();
  }
  double diff_s() const {
    return std::chrono::duration<double>(Clock::now() - start).count();
  }
};
