#pragma once

#include "util/times.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>
#include <thread>

// Returns false when the wait was interrupted.
using SleepFn = std::function<bool(milliseconds)>;

inline bool plain_sleep(milliseconds d) {
  std::this_thread::sleep_for(d);
  return true;
}

// Bounded retries with exponentially growing waits: base, 2*base, 4*base...
class Backoff {
  int attempts;
  milliseconds base;
  SleepFn sleep;

 public:
  Backoff(int attempts, milliseconds base, SleepFn sleep = plain_sleep)
      : attempts{attempts < 1 ? 1 : attempts},
        base{base},
        sleep{std::move(sleep)} {}

  int max_attempts() const { return attempts; }

  // doubling stops after max_doublings
  static constexpr int max_doublings = 16;

  milliseconds delay(int attempt) const {
    return base * (int64_t{1} << std::clamp(attempt, 0, max_doublings));
  }

  // f returns std::optional<R>; nullopt means "retry".
  template <typename F>
  auto run(std::string_view what, F&& f) const -> decltype(f()) {
    for (int i = 0; i < attempts; i++) {
      auto res = f();
      if (res)
        return res;

      if (i == attempts - 1)
        break;

      auto d = delay(i);
      spdlog::warn("[retry] {} attempt {}/{} failed, waiting {}ms", what,
                   i + 1, attempts, d.count());
      if (!sleep(d)) {
        spdlog::warn("[retry] {} interrupted", what);
        return std::nullopt;
      }
    }

    spdlog::error("[retry] {} failed after {} attempts", what, attempts);
    return std::nullopt;
  }
};
