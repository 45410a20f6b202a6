#pragma once

// cellar/config.hpp — Service configuration.
//
// PRECEDENCE (lowest to highest):
//   1. Built-in defaults below.
//   2. JSON file: --config FILE, else CELLAR_CONFIG.
//   3. Environment:
//        CELLAR_BASE_DIR
//        CELLAR_SESSION_TTL_HOURS
//        CELLAR_SWEEP_INTERVAL_MINUTES
//        CELLAR_REAPER_DISABLED=1
//        CELLAR_AUDIT_LOG
//
// JSON file keys use whole units (hours, minutes, MB, GB) so the file stays
// hand-editable; the struct holds exact byte counts and durations.

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "cellar/types.hpp"

namespace cellar {

struct CellarConfig {
  std::string base_dir{"user_uploads"};
  std::chrono::milliseconds session_ttl{std::chrono::hours(24)};
  std::chrono::milliseconds sweep_interval{std::chrono::minutes(60)};

  uint64_t max_upload_bytes{200ull * 1024 * 1024};
  uint64_t max_files_per_session{50};
  uint64_t max_storage_per_session_bytes{1024ull * 1024 * 1024};
  uint64_t max_total_storage_bytes{50ull * 1024 * 1024 * 1024};

  std::vector<std::string> allowed_upload_extensions{
      ".xlsx", ".xls", ".xlsm", ".xlsb", ".csv", ".txt", ".pdf", ".doc", ".docx", ".json", ".md"};
  std::vector<std::string> sensitive_keys{
      "api_key", "password", "secret", "token", "private_key", "access_token", "refresh_token"};

  bool reaper_enabled{true};
  bool sweep_on_startup{true};
  std::string audit_log_path;  // empty = audit trail disabled
  std::chrono::milliseconds execution_timeout{std::chrono::seconds(30)};

  // Reads the environment overrides on top of *this.
  Status apply_env();
};

// Overlays a JSON file onto cfg. Unknown keys are ignored; keys of the wrong
// type are reported as config_invalid.
Status load_config_file(const std::string& path, CellarConfig& cfg);

struct ConfigLoadResult {
  CellarConfig config;
  Status status;
  std::string source;  // file used, or empty

  bool ok() const { return status.ok(); }
};

// Full precedence chain. config_path overrides CELLAR_CONFIG when non-empty.
ConfigLoadResult load_config(const std::string& config_path = "");

struct ConfigValidation {
  bool ok{true};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

ConfigValidation validate_config(const CellarConfig& cfg);

std::string config_to_json(const CellarConfig& cfg);

// Strict base-10 unsigned parse for env values and CLI flags: digits only, no
// sign, no surrounding space, no overflow.
bool parse_u64(const std::string& text, uint64_t& out);

// True if ext (with or without leading dot, any case) is on the allow-list.
bool is_allowed_extension(const CellarConfig& cfg, const std::string& ext);

}  // namespace cellar
