#include "cellar/config.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "cellar/jsonlite.hpp"

namespace cellar {

namespace {

constexpr uint64_t kMiB = 1024ull * 1024;
constexpr uint64_t kGiB = 1024ull * kMiB;

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string normalize_ext(const std::string& ext) {
  std::string e = lower(ext);
  if (!e.empty() && e[0] != '.') e.insert(e.begin(), '.');
  return e;
}

// Fails when key is present with a type other than the one expected.
template <typename T>
bool has_type(const jsonlite::Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it == obj.end() || std::holds_alternative<T>(it->second.v);
}

bool is_number(const jsonlite::Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it == obj.end() || std::holds_alternative<std::uint64_t>(it->second.v) ||
         std::holds_alternative<double>(it->second.v);
}

}  // namespace

bool parse_u64(const std::string& text, uint64_t& out) {
  // strtoull accepts "-1" and wraps it; refuse any sign or leading space.
  if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) return false;
  errno = 0;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(text.c_str(), &end, 10);
  if (errno != 0 || *end != '\0') return false;
  out = v;
  return true;
}

Status CellarConfig::apply_env() {
  if (const char* e = std::getenv("CELLAR_BASE_DIR"); e && e[0]) base_dir = e;
  if (const char* e = std::getenv("CELLAR_AUDIT_LOG"); e && e[0]) audit_log_path = e;
  if (const char* e = std::getenv("CELLAR_REAPER_DISABLED"); e && std::string(e) == "1") {
    reaper_enabled = false;
  }
  if (const char* e = std::getenv("CELLAR_SESSION_TTL_HOURS"); e && e[0]) {
    uint64_t v = 0;
    if (!parse_u64(e, v)) {
      return Status::failure(ErrorCode::config_invalid, "CELLAR_SESSION_TTL_HOURS is not a non-negative integer");
    }
    session_ttl = std::chrono::hours(v);
  }
  if (const char* e = std::getenv("CELLAR_SWEEP_INTERVAL_MINUTES"); e && e[0]) {
    uint64_t v = 0;
    if (!parse_u64(e, v)) {
      return Status::failure(ErrorCode::config_invalid, "CELLAR_SWEEP_INTERVAL_MINUTES is not a non-negative integer");
    }
    sweep_interval = std::chrono::minutes(v);
  }
  return Status::success();
}

Status load_config_file(const std::string& path, CellarConfig& cfg) {
  std::ifstream in(path);
  if (!in) return Status::failure(ErrorCode::not_found, "config file not found: " + path);
  std::stringstream ss;
  ss << in.rdbuf();

  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(ss.str(), &err);
  if (err) return Status::failure(ErrorCode::json_parse_error, path + ": " + err->message);

  for (const char* key : {"base_dir", "audit_log_path"}) {
    if (!has_type<std::string>(obj, key)) {
      return Status::failure(ErrorCode::config_invalid, std::string(key) + " must be a string");
    }
  }
  for (const char* key : {"reaper_enabled", "sweep_on_startup"}) {
    if (!has_type<bool>(obj, key)) {
      return Status::failure(ErrorCode::config_invalid, std::string(key) + " must be a boolean");
    }
  }
  for (const char* key : {"session_ttl_hours", "sweep_interval_minutes", "max_upload_mb",
                          "max_files_per_session", "max_storage_per_session_mb",
                          "max_total_storage_gb", "execution_timeout_seconds"}) {
    if (!is_number(obj, key)) {
      return Status::failure(ErrorCode::config_invalid, std::string(key) + " must be a number");
    }
    if (jsonlite::get_double(obj, key, 0.0) < 0.0) {
      return Status::failure(ErrorCode::config_invalid, std::string(key) + " must not be negative");
    }
  }

  cfg.base_dir = jsonlite::get_string(obj, "base_dir", cfg.base_dir);
  cfg.audit_log_path = jsonlite::get_string(obj, "audit_log_path", cfg.audit_log_path);
  cfg.reaper_enabled = jsonlite::get_bool(obj, "reaper_enabled", cfg.reaper_enabled);
  cfg.sweep_on_startup = jsonlite::get_bool(obj, "sweep_on_startup", cfg.sweep_on_startup);

  using std::chrono::duration_cast;
  using std::chrono::milliseconds;
  if (obj.contains("session_ttl_hours")) {
    cfg.session_ttl = duration_cast<milliseconds>(
        std::chrono::duration<double, std::ratio<3600>>(jsonlite::get_double(obj, "session_ttl_hours")));
  }
  if (obj.contains("sweep_interval_minutes")) {
    cfg.sweep_interval = duration_cast<milliseconds>(
        std::chrono::duration<double, std::ratio<60>>(jsonlite::get_double(obj, "sweep_interval_minutes")));
  }
  if (obj.contains("execution_timeout_seconds")) {
    cfg.execution_timeout = duration_cast<milliseconds>(
        std::chrono::duration<double>(jsonlite::get_double(obj, "execution_timeout_seconds")));
  }
  if (obj.contains("max_upload_mb")) {
    cfg.max_upload_bytes = static_cast<uint64_t>(jsonlite::get_double(obj, "max_upload_mb") * kMiB);
  }
  if (obj.contains("max_storage_per_session_mb")) {
    cfg.max_storage_per_session_bytes =
        static_cast<uint64_t>(jsonlite::get_double(obj, "max_storage_per_session_mb") * kMiB);
  }
  if (obj.contains("max_total_storage_gb")) {
    cfg.max_total_storage_bytes =
        static_cast<uint64_t>(jsonlite::get_double(obj, "max_total_storage_gb") * kGiB);
  }
  cfg.max_files_per_session = jsonlite::get_u64(obj, "max_files_per_session", cfg.max_files_per_session);

  if (obj.contains("allowed_upload_extensions")) {
    cfg.allowed_upload_extensions.clear();
    for (const auto& e : jsonlite::get_string_array(obj, "allowed_upload_extensions")) {
      cfg.allowed_upload_extensions.push_back(normalize_ext(e));
    }
  }
  if (obj.contains("sensitive_keys")) {
    cfg.sensitive_keys.clear();
    for (const auto& k : jsonlite::get_string_array(obj, "sensitive_keys")) {
      cfg.sensitive_keys.push_back(lower(k));
    }
  }
  return Status::success();
}

ConfigLoadResult load_config(const std::string& config_path) {
  ConfigLoadResult out;
  std::string path = config_path;
  if (path.empty()) {
    const char* e = std::getenv("CELLAR_CONFIG");
    if (e && e[0]) path = e;
  }
  if (!path.empty()) {
    out.status = load_config_file(path, out.config);
    if (!out.ok()) return out;
    out.source = path;
  }
  out.status = out.config.apply_env();
  return out;
}

ConfigValidation validate_config(const CellarConfig& cfg) {
  ConfigValidation v;
  if (cfg.base_dir.empty()) {
    v.errors.push_back("base_dir is empty");
  }
  if (cfg.max_storage_per_session_bytes > cfg.max_total_storage_bytes) {
    v.errors.push_back("per-session storage limit exceeds total storage limit");
  }
  if (cfg.session_ttl.count() <= 0) {
    v.errors.push_back("session_ttl must be positive");
  }
  if (cfg.sweep_interval.count() <= 0) {
    v.errors.push_back("sweep_interval must be positive");
  }
  if (cfg.sweep_interval > cfg.session_ttl) {
    v.warnings.push_back("sweep interval exceeds session ttl; expired sessions may pile up");
  }
  if (cfg.max_upload_bytes > cfg.max_storage_per_session_bytes) {
    v.warnings.push_back("max upload size exceeds per-session storage limit");
  }
  if (cfg.max_files_per_session == 0) {
    v.warnings.push_back("max_files_per_session is 0; every upload will be rejected");
  }
  if (cfg.allowed_upload_extensions.empty()) {
    v.warnings.push_back("no upload extensions allowed");
  }
  v.ok = v.errors.empty();
  return v;
}

std::string config_to_json(const CellarConfig& cfg) {
  using namespace std::chrono;
  jsonlite::Array exts, keys;
  for (const auto& e : cfg.allowed_upload_extensions) exts.emplace_back(e);
  for (const auto& k : cfg.sensitive_keys) keys.emplace_back(k);
  jsonlite::Object o;
  o["base_dir"] = cfg.base_dir;
  o["session_ttl_ms"] = static_cast<std::uint64_t>(cfg.session_ttl.count());
  o["sweep_interval_ms"] = static_cast<std::uint64_t>(cfg.sweep_interval.count());
  o["execution_timeout_ms"] = static_cast<std::uint64_t>(cfg.execution_timeout.count());
  o["max_upload_bytes"] = cfg.max_upload_bytes;
  o["max_files_per_session"] = cfg.max_files_per_session;
  o["max_storage_per_session_bytes"] = cfg.max_storage_per_session_bytes;
  o["max_total_storage_bytes"] = cfg.max_total_storage_bytes;
  o["allowed_upload_extensions"] = std::move(exts);
  o["sensitive_keys"] = std::move(keys);
  o["reaper_enabled"] = cfg.reaper_enabled;
  o["sweep_on_startup"] = cfg.sweep_on_startup;
  o["audit_log_path"] = cfg.audit_log_path;
  return jsonlite::to_json(o);
}

bool is_allowed_extension(const CellarConfig& cfg, const std::string& ext) {
  const std::string e = normalize_ext(ext);
  return std::find(cfg.allowed_upload_extensions.begin(), cfg.allowed_upload_extensions.end(), e) !=
         cfg.allowed_upload_extensions.end();
}

}  // namespace cellar
