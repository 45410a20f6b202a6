#include "cellar/reaper.hpp"

#include "cellar/log.hpp"
#include "cellar/session_registry.hpp"

namespace cellar {

Reaper::Reaper(SessionRegistry& registry, std::chrono::milliseconds interval, std::chrono::milliseconds ttl)
    : registry_(registry), interval_(interval), ttl_(ttl) {}

Reaper::~Reaper() { stop(); }

void Reaper::start() {
  std::lock_guard<std::mutex> lock(mu_);
  if (worker_.joinable()) return;
  stopping_ = false;
  worker_ = std::thread([this] { worker_loop(); });
  log_event(LogLevel::info, "reaper", "started",
            {{"interval_ms", std::to_string(interval_.count())}, {"ttl_ms", std::to_string(ttl_.count())}});
}

void Reaper::stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
    log_event(LogLevel::info, "reaper", "stopped", {{"cycles", std::to_string(cycles())}});
  }
}

bool Reaper::running() const {
  std::lock_guard<std::mutex> lock(mu_);
  return worker_.joinable() && !stopping_;
}

void Reaper::worker_loop() {
  while (true) {
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait_for(lock, interval_, [this] { return stopping_.load(); });
      if (stopping_) return;
    }
    const std::size_t purged = registry_.sweep(ttl_);
    purged_total_.fetch_add(purged, std::memory_order_relaxed);
    cycles_.fetch_add(1, std::memory_order_relaxed);
  }
}

}  // namespace cellar
