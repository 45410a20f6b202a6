#include "cellar/user_config.hpp"

#include <algorithm>
#include <cctype>

#include "cellar/jsonlite.hpp"
#include "cellar/version.hpp"

namespace cellar {

namespace {

constexpr const char* kMask = "********";
constexpr std::size_t kPreviewKeep = 4;

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

std::string mask_secret(const std::string& value) {
  if (value.empty()) return "";
  if (value.size() <= 2 * kPreviewKeep) return kMask;
  return value.substr(0, kPreviewKeep) + kMask + value.substr(value.size() - kPreviewKeep);
}

bool is_sensitive_key(const std::string& key, const std::vector<std::string>& sensitive_keys) {
  const std::string k = lower(key);
  for (const auto& s : sensitive_keys) {
    if (k == lower(s)) return true;
  }
  static const char* kSuffixes[] = {"_key", "_token", "_secret", "_password", "_credential"};
  for (const char* suffix : kSuffixes) {
    if (ends_with(k, suffix)) return true;
  }
  return false;
}

RedactedConfig redact(const ConfigRecord& cfg, const std::vector<std::string>& sensitive_keys) {
  RedactedConfig v;
  v.model = cfg.model;
  v.temperature = cfg.temperature;
  v.max_tokens = cfg.max_tokens;
  v.has_api_key = !cfg.api_key.empty();
  v.api_key_preview = mask_secret(cfg.api_key);
  for (const auto& [k, val] : cfg.extra) {
    v.extra[k] = is_sensitive_key(k, sensitive_keys) ? mask_secret(val) : val;
  }
  return v;
}

std::string config_record_to_json(const ConfigRecord& cfg, uint64_t updated_at_unix_ms) {
  jsonlite::Object extra;
  for (const auto& [k, v] : cfg.extra) extra[k] = v;
  jsonlite::Object o;
  o["format_version"] = static_cast<std::uint64_t>(version::CONFIG_FORMAT_VERSION);
  o["updated_at"] = updated_at_unix_ms;
  o["model"] = cfg.model;
  o["temperature"] = cfg.temperature;
  o["max_tokens"] = cfg.max_tokens;
  o["api_key"] = cfg.api_key;
  o["extra"] = std::move(extra);
  return jsonlite::to_json(o);
}

Status config_record_from_json(const std::string& text, ConfigRecord& out) {
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(text, &err);
  if (err) return Status::failure(ErrorCode::json_parse_error, err->message);

  const uint64_t fmt = jsonlite::get_u64(obj, "format_version", version::CONFIG_FORMAT_VERSION);
  if (fmt > version::CONFIG_FORMAT_VERSION) {
    return Status::failure(ErrorCode::config_invalid,
                           "config format_version " + std::to_string(fmt) + " is newer than supported");
  }

  const ConfigRecord defaults;
  ConfigRecord cfg;
  cfg.model = jsonlite::get_string(obj, "model", defaults.model);
  cfg.temperature = jsonlite::get_double(obj, "temperature", defaults.temperature);
  cfg.max_tokens = jsonlite::get_u64(obj, "max_tokens", defaults.max_tokens);
  cfg.api_key = jsonlite::get_string(obj, "api_key");
  cfg.extra = jsonlite::get_string_map(obj, "extra");
  out = std::move(cfg);
  return Status::success();
}

std::string redacted_config_to_json(const RedactedConfig& view, uint64_t cached_at_unix_ms) {
  jsonlite::Object extra;
  for (const auto& [k, v] : view.extra) extra[k] = v;
  jsonlite::Object o;
  o["model"] = view.model;
  o["temperature"] = view.temperature;
  o["max_tokens"] = view.max_tokens;
  o["has_api_key"] = view.has_api_key;
  o["api_key_preview"] = view.api_key_preview;
  o["extra"] = std::move(extra);
  o["cached_at"] = cached_at_unix_ms;
  o["cache_type"] = "client_safe";
  return jsonlite::to_json(o);
}

}  // namespace cellar
