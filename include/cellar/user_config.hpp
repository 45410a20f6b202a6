#pragma once

// cellar/user_config.hpp — Per-session model settings and their two views.
//
// TRUST TIERS:
//   ConfigRecord    full record, server side only (config.json).
//   RedactedConfig  derived view; the only form allowed to leave the server
//                   (client_view.json, CLI `redact`, analysis collaborators).
//
// redact() takes the record by const reference and returns a distinct type,
// so there is no code path from a RedactedConfig back into a ConfigRecord and
// no way to serialize a ConfigRecord through the client-view writer.

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "cellar/types.hpp"

namespace cellar {

struct ConfigRecord {
  std::string model{"gpt-4.1-mini"};
  double temperature{0.7};
  uint64_t max_tokens{3000};
  std::string api_key;                         // credential material
  std::map<std::string, std::string> extra;    // e.g. base_url

  bool operator==(const ConfigRecord&) const = default;
};

struct RedactedConfig {
  std::string model;
  double temperature{0.0};
  uint64_t max_tokens{0};
  bool has_api_key{false};
  std::string api_key_preview;                 // fixed-length mask, never the secret
  std::map<std::string, std::string> extra;    // sensitive values masked
};

// Fixed-length preview: values longer than 8 bytes keep their first and last
// 4 bytes around "********" (always 16 bytes); shorter values become "********".
// Empty stays empty.
std::string mask_secret(const std::string& value);

// Case-insensitive. Sensitive if listed, or ending in _key, _token, _secret,
// _password or _credential.
bool is_sensitive_key(const std::string& key, const std::vector<std::string>& sensitive_keys);

RedactedConfig redact(const ConfigRecord& cfg, const std::vector<std::string>& sensitive_keys);

// config.json. updated_at is informational and ignored when loading.
std::string config_record_to_json(const ConfigRecord& cfg, uint64_t updated_at_unix_ms);
Status config_record_from_json(const std::string& text, ConfigRecord& out);

// client_view.json; carries cached_at and cache_type = "client_safe".
std::string redacted_config_to_json(const RedactedConfig& view, uint64_t cached_at_unix_ms);

}  // namespace cellar
