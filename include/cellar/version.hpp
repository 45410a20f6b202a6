#pragma once

// cellar/version.hpp — Version manifest for every persisted or derived format.
//
// PURPOSE:
//   Prevent silent drift between the on-disk workspace layout, the persisted
//   config record, the session id scheme and the audit trail. Any component that
//   reads or writes one of these formats names its constant here.
//
// INVARIANT:
//   All constants are compile-time. Bumping SESSION_ID_SCHEME_VERSION changes
//   every derived id, which orphans existing workspaces until the reaper
//   collects them.

#include <cstdint>
#include <string>

namespace cellar {
namespace version {

// ---------------------------------------------------------------------------
// WORKSPACE_LAYOUT_VERSION
// Version 1 = {base}/{session}/{uploads,exports,temp}/ + config.json +
// client_view.json. Adding or renaming a sub-directory requires a bump.
// ---------------------------------------------------------------------------
constexpr uint32_t WORKSPACE_LAYOUT_VERSION = 1;

// ---------------------------------------------------------------------------
// CONFIG_FORMAT_VERSION
// Tracks the JSON schema of config.json. Readers accept any record whose
// format_version is <= this value and fill missing fields with defaults.
// ---------------------------------------------------------------------------
constexpr uint32_t CONFIG_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// SESSION_ID_SCHEME_VERSION
// Version 1 = "user_" + first 16 hex chars of BLAKE3("sid:" || signature ||
// hour bucket). Included in the hashed material.
// ---------------------------------------------------------------------------
constexpr uint32_t SESSION_ID_SCHEME_VERSION = 1;

// ---------------------------------------------------------------------------
// AUDIT_LOG_VERSION
// NDJSON file-operation records chained by BLAKE3 of the previous line.
// ---------------------------------------------------------------------------
constexpr uint32_t AUDIT_LOG_VERSION = 1;

constexpr const char* CELLAR_SEMVER = "0.3.0";

// ---------------------------------------------------------------------------
// Structured version manifest (reported by `cellar version`)
// ---------------------------------------------------------------------------
struct VersionManifest {
  uint32_t workspace_layout{WORKSPACE_LAYOUT_VERSION};
  uint32_t config_format{CONFIG_FORMAT_VERSION};
  uint32_t session_id_scheme{SESSION_ID_SCHEME_VERSION};
  uint32_t audit_log{AUDIT_LOG_VERSION};
  std::string semver;           // CELLAR_SEMVER unless overridden
  std::string hash_primitive;   // "blake3"
  std::string build_timestamp;  // from __DATE__/__TIME__
};

VersionManifest current_manifest(const std::string& semver = "");

// Serialize to compact JSON.
std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace cellar
