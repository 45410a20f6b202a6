#pragma once

// cellar/workspace_store.hpp — On-disk layout of per-session workspaces.
//
// LAYOUT (WORKSPACE_LAYOUT_VERSION 1):
//   {base}/{session_id}/uploads/
//   {base}/{session_id}/exports/
//   {base}/{session_id}/temp/
//   {base}/{session_id}/config.json        full ConfigRecord (server side only)
//   {base}/{session_id}/client_view.json   redacted view
//
// CONCURRENCY:
//   - Every mutating operation on one id runs under that id's mutex (lock
//     table keyed by id). Different ids never share a lock, so blocking I/O
//     for one session never stalls another.
//   - Root creation uses fs::create_directory, which reports whether this
//     caller made the directory. Exactly one of N concurrent ensure() calls
//     observes created == true, even across processes.
//   - config.json and client_view.json are replaced by write-to-temp + rename,
//     so a reader never sees a half-written record.
//
// All paths are resolved through PathSandbox against the canonical base.

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "cellar/config.hpp"
#include "cellar/path_sandbox.hpp"
#include "cellar/types.hpp"
#include "cellar/user_config.hpp"

namespace cellar {

// "20250101_120000" (uploads) and "20250101120000" (exports), local time.
std::string upload_timestamp(uint64_t unix_ms);
std::string export_timestamp(uint64_t unix_ms);
uint64_t now_unix_ms();

// Strips a leading "YYYYMMDD_HHMMSS_" or "YYYYMMDDHHMMSS_" prefix.
std::string strip_timestamp_prefix(const std::string& stored_name);

// Creates {dir}/{prefix}_{name} with O_CREAT|O_EXCL. If taken, tries
// {prefix}_{stem}_{n}{ext} for n = 1, 2, ... The returned file exists and is
// empty; the caller owns writing it.
struct ReservedPath {
  std::string path;
  Status status;

  bool ok() const { return status.ok(); }
};
ReservedPath reserve_unique_path(const std::string& dir, const std::string& prefix,
                                 const std::string& sanitized_name);

// Replace target with data via a temp file in the same directory and rename().
bool atomic_write(const std::string& target, const std::string& data);

class WorkspaceStore {
 public:
  explicit WorkspaceStore(CellarConfig cfg);

  // Creates the base directory and resolves it. Must succeed before use.
  Status init();

  const std::string& base_dir() const { return base_; }
  const CellarConfig& config() const { return cfg_; }

  // Idempotent. Creates the scaffold and a default config.json if absent.
  EnsureResult ensure(const SessionId& id);

  // Layout of id without touching the disk; invalid Workspace on bad id.
  Workspace layout(const SessionId& id) const;
  bool exists(const SessionId& id) const;

  // not_found when the workspace or config.json is absent.
  Status load_config(const SessionId& id, ConfigRecord& out) const;
  Status save_config(const SessionId& id, const ConfigRecord& cfg);
  Status save_client_view(const SessionId& id, const ConfigRecord& cfg);

  // Newest first.
  std::vector<ExportEntry> list_exports(const SessionId& id) const;

  // Idempotent: a missing workspace is success.
  Status purge(const SessionId& id);

  StoreUsage total_usage() const;
  SessionUsage session_usage(const SessionId& id) const;

  UploadResult save_upload(const SessionId& id, const std::string& original_name,
                           const std::string& bytes);
  // Newest first.
  std::vector<UploadEntry> list_uploads(const SessionId& id) const;
  // Matches the stored name or the display name; newest match wins.
  std::optional<UploadEntry> find_upload(const SessionId& id, const std::string& name) const;

  // Sandboxed path under temp/. Empty name yields temp_XXXXXXXX.tmp.
  PathResolution temp_path(const SessionId& id, const std::string& name = "") const;

  // Workspaces present on disk, with the newest mtime found inside each.
  std::vector<std::pair<SessionId, uint64_t>> scan() const;

 private:
  std::shared_ptr<std::mutex> lock_for(const SessionId& id);

  CellarConfig cfg_;
  std::string base_;  // canonical, set by init()

  std::mutex table_mu_;
  std::unordered_map<SessionId, std::weak_ptr<std::mutex>> locks_;
};

}  // namespace cellar
