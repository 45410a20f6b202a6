#pragma once

// cellar/types.hpp — Core data structures for per-session workspace isolation.
//
// ARCHITECTURE NOTES:
//
// ISOLATION GUARANTEES:
//   - Every path handed out by WorkspaceStore or FileInterceptor has passed
//     PathSandbox against the process-wide base directory (and, for saves, the
//     session's exports directory). Nothing in this header is trusted input.
//   - SessionId is the sole key into WorkspaceStore and SessionRegistry. Ids
//     accepted from a client are validated (is_valid_session_id) before use as a
//     directory name.
//
// CONCURRENCY NOTES:
//   - Workspace, SessionRecord, ExportEntry are value types. Copies are
//     snapshots; the registry owns the live lastSeenAt.
//
// MEMORY OWNERSHIP:
//   - All string members are value-owned. No borrowed references, no raw
//     pointer members in any public type.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cellar {

enum class ErrorCode {
  none,
  path_escape,
  workspace_create_conflict,
  write_failed,
  not_found,
  interception_leak,
  quota_exceeded,
  invalid_session_id,
  invalid_argument,
  config_invalid,
  json_parse_error,
  cancelled,
};

std::string to_string(ErrorCode code);

// Outcome of an operation that produces nothing but success/failure.
struct Status {
  ErrorCode code{ErrorCode::none};
  std::string message;

  bool ok() const { return code == ErrorCode::none; }

  static Status success() { return {}; }
  static Status failure(ErrorCode c, std::string msg) { return Status{c, std::move(msg)}; }
};

using SessionId = std::string;

// Ids are used verbatim as directory names: [A-Za-z0-9_-]{1,64}.
bool is_valid_session_id(const std::string& id);

// ---------------------------------------------------------------------------
// SessionRecord — registry snapshot of one session.
// ---------------------------------------------------------------------------
struct SessionRecord {
  SessionId id;
  uint64_t created_at_unix_ms{0};
  uint64_t last_seen_unix_ms{0};  // only mutable field; owned by SessionRegistry
  std::string workspace_root;
};

// ---------------------------------------------------------------------------
// Workspace — resolved on-disk layout of one session.
// Invariant: uploads/exports/temp are children of root; root is a child of the
// store's base directory. All paths are canonical.
// ---------------------------------------------------------------------------
struct Workspace {
  SessionId session_id;
  std::string root;
  std::string uploads;
  std::string exports;
  std::string temp;
  std::string config_path;

  bool valid() const { return !root.empty(); }
  bool operator==(const Workspace&) const = default;
};

struct EnsureResult {
  Workspace workspace;
  bool created{false};  // true only for the caller that laid down the scaffold
  Status status;

  bool ok() const { return status.ok(); }
};

// Listing entry for exports/ (UI download listing).
struct ExportEntry {
  std::string name;
  std::string path;
  uint64_t size{0};
  int64_t mtime_unix_ms{0};
};

enum class FileKind { excel, csv, text, pdf, word, other };

std::string to_string(FileKind kind);
FileKind file_kind_for_extension(const std::string& ext);

// Listing entry for uploads/.
struct UploadEntry {
  std::string name;          // stored name, with timestamp prefix
  std::string display_name;  // original name, prefix stripped
  FileKind kind{FileKind::other};
  std::string path;
  uint64_t size{0};
  int64_t mtime_unix_ms{0};
};

struct UploadResult {
  std::string path;
  Status status;

  bool ok() const { return status.ok(); }
};

struct SessionUsage {
  uint64_t bytes_used{0};
  uint64_t file_count{0};
};

struct StoreUsage {
  uint64_t session_count{0};
  uint64_t bytes_used{0};
};

struct RegistryStats {
  uint64_t active_sessions{0};
  uint64_t total_bytes{0};
};

// A save that the interceptor refused or could not complete.
struct SaveFailure {
  std::string operation;       // SaveOperation name, e.g. export_table or copy_to_exports
  std::string requested_name;  // as passed by the executed code
  ErrorCode error{ErrorCode::none};
  std::string message;
};

// Returned by FileInterceptor end(): successful saves in call order, failures
// reported separately.
struct InterceptionResult {
  std::vector<std::string> produced_files;
  std::vector<SaveFailure> failures;
  bool leak_detected{false};
};

// Tabular payload for the spreadsheet-export operation.
struct Table {
  std::vector<std::string> columns;
  std::vector<std::vector<std::string>> rows;
};

}  // namespace cellar
