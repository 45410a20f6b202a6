#pragma once

// cellar/log.hpp — Structured NDJSON logging.
//
// FORMAT: one JSON object per line:
//   {"ts_ms":1700000000000,"level":"info","component":"reaper","msg":"sweep done","purged":"3"}
// Extra fields are string-valued and emitted after the fixed keys, in call order.
//
// SINKS (first match wins):
//   1. set_log_hook() hook, if installed (tests, embedding hosts).
//   2. File named by CELLAR_LOG (append).
//   3. stderr.
//
// PRIVACY: callers never pass credential material or file contents as fields.

#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace cellar {

enum class LogLevel { debug = 0, info = 1, warn = 2, error = 3, fatal = 4 };

std::string to_string(LogLevel level);
// Unknown names map to info.
LogLevel log_level_from_string(const std::string& name);

using LogField = std::pair<std::string, std::string>;

struct LogRecord {
  uint64_t ts_ms{0};
  LogLevel level{LogLevel::info};
  std::string component;
  std::string msg;
  std::vector<LogField> fields;
};

std::string log_record_to_json(const LogRecord& r);

using LogHook = void (*)(const LogRecord&);
void set_log_hook(LogHook hook);

// Minimum level; defaults to CELLAR_LOG_LEVEL or info.
void set_min_log_level(LogLevel level);
LogLevel min_log_level();

void log_event(LogLevel level, const std::string& component, const std::string& msg,
               std::initializer_list<LogField> fields = {});

}  // namespace cellar
