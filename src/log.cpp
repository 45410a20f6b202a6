#include "cellar/log.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <mutex>

#include "cellar/jsonlite.hpp"

namespace cellar {

namespace {

std::atomic<LogHook> g_log_hook{nullptr};
std::atomic<int> g_min_level{-1};  // -1 = not yet read from env
std::mutex g_write_mu;

uint64_t now_ms() {
  using SC = std::chrono::system_clock;
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(SC::now().time_since_epoch()).count());
}

}  // namespace

std::string to_string(LogLevel level) {
  switch (level) {
    case LogLevel::debug: return "debug";
    case LogLevel::info: return "info";
    case LogLevel::warn: return "warn";
    case LogLevel::error: return "error";
    case LogLevel::fatal: return "fatal";
  }
  return "info";
}

LogLevel log_level_from_string(const std::string& name) {
  if (name == "debug") return LogLevel::debug;
  if (name == "warn" || name == "warning") return LogLevel::warn;
  if (name == "error") return LogLevel::error;
  if (name == "fatal") return LogLevel::fatal;
  return LogLevel::info;
}

std::string log_record_to_json(const LogRecord& r) {
  std::string line;
  line.reserve(128 + r.msg.size());
  line += "{\"ts_ms\":";
  line += std::to_string(r.ts_ms);
  line += ",\"level\":\"";
  line += to_string(r.level);
  line += "\",\"component\":\"";
  line += jsonlite::escape(r.component);
  line += "\",\"msg\":\"";
  line += jsonlite::escape(r.msg);
  line += "\"";
  for (const auto& [k, v] : r.fields) {
    line += ",\"";
    line += jsonlite::escape(k);
    line += "\":\"";
    line += jsonlite::escape(v);
    line += "\"";
  }
  line += "}";
  return line;
}

void set_log_hook(LogHook hook) { g_log_hook.store(hook, std::memory_order_release); }

void set_min_log_level(LogLevel level) {
  g_min_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel min_log_level() {
  int lvl = g_min_level.load(std::memory_order_relaxed);
  if (lvl < 0) {
    const char* env = std::getenv("CELLAR_LOG_LEVEL");
    lvl = static_cast<int>(env && env[0] ? log_level_from_string(env) : LogLevel::info);
    int expected = -1;
    g_min_level.compare_exchange_strong(expected, lvl, std::memory_order_relaxed);
    lvl = g_min_level.load(std::memory_order_relaxed);
  }
  return static_cast<LogLevel>(lvl);
}

void log_event(LogLevel level, const std::string& component, const std::string& msg,
               std::initializer_list<LogField> fields) {
  if (static_cast<int>(level) < static_cast<int>(min_log_level())) return;

  LogRecord rec;
  rec.ts_ms = now_ms();
  rec.level = level;
  rec.component = component;
  rec.msg = msg;
  rec.fields.assign(fields.begin(), fields.end());

  if (LogHook hook = g_log_hook.load(std::memory_order_acquire)) {
    hook(rec);
    return;
  }

  const std::string line = log_record_to_json(rec) + "\n";
  std::lock_guard<std::mutex> lk(g_write_mu);
  const char* path = std::getenv("CELLAR_LOG");
  if (path && path[0]) {
    if (FILE* f = std::fopen(path, "a")) {
      std::fwrite(line.data(), 1, line.size(), f);
      std::fclose(f);
      return;
    }
  }
  std::fwrite(line.data(), 1, line.size(), stderr);
}

}  // namespace cellar
