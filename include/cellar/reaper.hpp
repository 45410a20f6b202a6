#pragma once

// cellar/reaper.hpp — Periodic expiry of idle sessions.
//
// Owns one worker thread that calls SessionRegistry::sweep(ttl) every
// `interval`. Talks to the registry only through sweep(); failures are logged
// and counted by the registry and retried on the next cycle, never propagated.
// stop() wakes the worker immediately and joins it; the destructor calls stop().

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace cellar {

class SessionRegistry;

class Reaper {
 public:
  Reaper(SessionRegistry& registry, std::chrono::milliseconds interval, std::chrono::milliseconds ttl);
  ~Reaper();

  Reaper(const Reaper&) = delete;
  Reaper& operator=(const Reaper&) = delete;

  void start();
  void stop();
  bool running() const;

  uint64_t cycles() const { return cycles_.load(std::memory_order_relaxed); }
  uint64_t purged_total() const { return purged_total_.load(std::memory_order_relaxed); }

 private:
  void worker_loop();

  SessionRegistry& registry_;
  std::chrono::milliseconds interval_;
  std::chrono::milliseconds ttl_;
  std::thread worker_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::atomic<bool> stopping_{false};
  std::atomic<uint64_t> cycles_{0};
  std::atomic<uint64_t> purged_total_{0};
};

}  // namespace cellar
