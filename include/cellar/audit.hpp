#pragma once

// cellar/audit.hpp — Append-only audit trail of intercepted saves.
//
// DESIGN INVARIANTS (must not be broken):
//   1. APPEND-ONLY: entries are never modified or deleted.
//   2. SEQUENTIAL: each entry carries a monotonically increasing sequence number.
//   3. CHAINED: each entry stores the BLAKE3 ("aud:" domain) digest of the
//      previous entry's JSON line. The first entry chains to 64 zeros.
//   4. FAIL-SAFE: a failed audit write never fails the save it describes;
//      failures are counted separately.
//   5. PRIVACY: entries carry names and sizes, never file contents.
//
// Disabled (every append is a successful no-op) when constructed with an
// empty path. Enabled by CELLAR_AUDIT_LOG or CellarConfig::audit_log_path.

#include <cstdint>
#include <memory>
#include <string>

namespace cellar {

struct FileAuditRecord {
  uint64_t    sequence{0};          // assigned by append()
  std::string previous_digest;      // assigned by append()
  std::string session_id;
  std::string operation;            // open_for_write | export_table | dump_json | write_text
  std::string requested_name;       // sanitized form only
  std::string redirected_path;      // empty when the save was refused
  bool        ok{false};
  std::string error_code;           // empty if ok
  uint64_t    bytes{0};
  uint64_t    timestamp_unix_ms{0}; // assigned by append()
};

std::string audit_record_to_json(const FileAuditRecord& r);

struct AuditLogImpl;

class FileAuditLog {
 public:
  explicit FileAuditLog(const std::string& path = "");
  ~FileAuditLog();

  FileAuditLog(const FileAuditLog&) = delete;
  FileAuditLog& operator=(const FileAuditLog&) = delete;

  // Assigns sequence, previous_digest and timestamp in place.
  // INVARIANT: if append() returns false, the entry was NOT counted.
  bool append(FileAuditRecord& record);

  bool enabled() const;
  uint64_t entry_count() const;
  uint64_t failure_count() const;
  const std::string& path() const { return path_; }

 private:
  std::string path_;
  std::unique_ptr<AuditLogImpl> impl_;
};

struct AuditChainCheck {
  bool ok{false};
  uint64_t entries{0};
  uint64_t first_bad_sequence{0};  // 0 when ok
  std::string message;
};

// Re-reads an audit file and recomputes the digest chain.
AuditChainCheck verify_audit_chain(const std::string& path);

}  // namespace cellar
