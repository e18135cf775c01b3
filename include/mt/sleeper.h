#pragma once

#include "core/backoff.h"

#include <pthread.h>
#include <atomic>
#include <condition_variable>
#include <csignal>
#include <mutex>
#include <stdexcept>
#include <thread>

// Waits that end early on SIGINT/SIGTERM. Construct before any other thread
// so the signal mask is inherited.
class Sleeper {
  std::atomic<bool> shutdown_requested{false};
  std::mutex mtx;
  std::condition_variable cv;
  std::thread td;

  static sigset_t signal_set() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    return set;
  }

  void handler() {
    auto set = signal_set();
    int signum;
    while (sigwait(&set, &signum) == 0) {
      if (!should_shutdown())
        spdlog::warn("[sleeper] signal {}, shutting down", signum);
      request_shutdown();
      break;
    }
  }

 public:
  Sleeper() {
    auto set = signal_set();
    if (pthread_sigmask(SIG_BLOCK, &set, nullptr) != 0)
      throw std::runtime_error("Failed to block signals");
    td = std::thread(&Sleeper::handler, this);
  }

  ~Sleeper() {
    if (!should_shutdown())
      request_shutdown();

    if (td.joinable()) {
      // wake the sigwait so the thread can exit
      pthread_kill(td.native_handle(), SIGINT);
      td.join();
    }
  }

  Sleeper(const Sleeper&) = delete;
  Sleeper& operator=(const Sleeper&) = delete;
  Sleeper(Sleeper&&) = delete;
  Sleeper& operator=(Sleeper&&) = delete;

  bool should_shutdown() const {
    return shutdown_requested.load(std::memory_order_acquire);
  }

  void request_shutdown() {
    {
      std::lock_guard lk{mtx};
      shutdown_requested.store(true, std::memory_order_release);
    }
    cv.notify_all();
  }

  template <typename Rep, typename Period>
  bool sleep_for(const std::chrono::duration<Rep, Period> duration) {
    if (should_shutdown())
      return false;
    std::unique_lock lk{mtx};
    return !cv.wait_for(lk, duration, [this] { return should_shutdown(); });
  }

  SleepFn sleep_fn() {
    return [this](milliseconds d) { return sleep_for(d); };
  }
};
