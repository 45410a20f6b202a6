#pragma once

// cellar/interceptor.hpp — Redirection of file-producing calls made by
// executed code into the session's exports/ directory.
//
// BINDING STRATEGY:
//   No process-wide operation table is mutated. An InterceptionSession is an
//   explicit capability handed to executed code (ExecutionContext), and
//   ScopedInterception additionally binds it to the calling thread so that the
//   ambient cellar::fileops functions route through it. Concurrent executions
//   on different threads therefore never contend or observe each other's
//   bindings.
//
// REDIRECTION:
//   requested "../../etc/report.xlsx"
//     -> sanitize_filename      "report.xlsx"
//     -> {exports}/{YYYYMMDDHHMMSS}_report.xlsx   (created O_EXCL)
//     -> on collision           {exports}/{ts}_report_1.xlsx, _2, ...
//   Every candidate is checked by PathSandbox against exports/. Absolute
//   targets are redirected like any other name; the caller never chooses the
//   directory.
//
// FAILURES are per save: a refused or failed save is recorded in
// InterceptionResult::failures and never appears in produced_files. Only
// cancellation (ExecutionCancelled) unwinds the executed code.
//
// QUOTA: with a store and max_session_bytes set, every save is checked twice:
// before the target is reserved (bytes already on disk plus the known size)
// and after the write (actual session usage). A save that lands over the limit
// is deleted and reported as quota_exceeded. Streams and reserved export paths
// are written after the call returns, so end() re-checks them newest first.
//
// LEAKS: an InterceptionSession destroyed without end(), or a
// ScopedInterception released while another session is bound, is an
// InterceptionLeak. It is logged at fatal level and counted; end() is then
// run so nothing stays bound.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "cellar/jsonlite.hpp"
#include "cellar/path_sandbox.hpp"
#include "cellar/types.hpp"

namespace cellar {

class FileAuditLog;
class WorkspaceStore;

enum class SaveOperation { open_for_write, export_table, dump_json, write_text, copy_to_exports, export_path };
std::string to_string(SaveOperation op);

// Thrown out of interception calls once the session is cancelled or past its
// deadline. Caught by Executor; never crosses a public API boundary.
class ExecutionCancelled : public std::runtime_error {
 public:
  ExecutionCancelled() : std::runtime_error("execution cancelled") {}
};

// The real spreadsheet writer. The default writes delimited text (tab for
// .tsv, comma otherwise); hosts with an Office library inject their own.
using TableWriter = std::function<Status(const std::string& path, const Table& table)>;
Status write_table_delimited(const std::string& path, const Table& table);

struct OpenResult {
  std::unique_ptr<std::ofstream> stream;
  std::string path;
  Status status;

  bool ok() const { return status.ok(); }
};

struct InterceptorOptions {
  WorkspaceStore* store{nullptr};  // quota source; null disables the check
  FileAuditLog* audit{nullptr};    // null disables the audit trail
  uint64_t max_session_bytes{0};   // 0 = unlimited
  TableWriter table_writer;        // empty = write_table_delimited
  std::function<uint64_t()> clock; // unix ms; empty = system clock
};

class InterceptionSession {
 public:
  InterceptionSession(Workspace workspace, InterceptorOptions options);
  ~InterceptionSession();

  InterceptionSession(const InterceptionSession&) = delete;
  InterceptionSession& operator=(const InterceptionSession&) = delete;

  // (1) generic open-for-write. The stream targets the redirected path.
  OpenResult open_for_write(const std::string& name, bool binary = false);
  // (2) tabular export
  Status export_table(const std::string& name, const Table& table);
  // (3) structured-data dump
  Status dump_json(const std::string& name, const jsonlite::Value& value);
  // (4) plain-text / document write
  Status write_text(const std::string& name, const std::string& text);

  // Copies a file that already lives inside this workspace (typically under
  // temp/ or uploads/) into exports. name defaults to the source's file name.
  Status copy_to_exports(const std::string& source, const std::string& name = "");
  // Reserves a redirected export path for writers that open files themselves.
  // The path counts as produced.
  PathResolution export_path(const std::string& name);
  // Sandboxed scratch path under temp/. Nothing is created or recorded.
  PathResolution temp_path(const std::string& name) const;

  // Restores nothing global (nothing was changed); closes the session and
  // hands back what it produced. Idempotent: later calls return the same result.
  InterceptionResult end();

  bool active() const { return !ended_.load(std::memory_order_acquire); }
  const Workspace& workspace() const { return workspace_; }
  std::vector<std::string> produced_files() const;

  // Cooperative cancellation; the next interception call (or checkpoint())
  // throws ExecutionCancelled.
  void cancel() { cancelled_.store(true, std::memory_order_release); }
  bool cancelled() const;
  void set_deadline(std::chrono::steady_clock::time_point deadline);
  void checkpoint() const;

  void mark_leak();

 private:
  struct Target {
    std::string path;
    Status status;
  };
  Target redirect(SaveOperation op, const std::string& requested, uint64_t bytes);
  Status finish_save(SaveOperation op, const std::string& requested, const Target& target,
                     const Status& write_status, uint64_t bytes);
  void record_failure(SaveOperation op, const std::string& requested, const Status& st);
  bool over_quota() const;
  void enforce_deferred_quota();
  void audit(SaveOperation op, const std::string& requested, const std::string& path,
             const Status& st, uint64_t bytes);

  Workspace workspace_;
  InterceptorOptions options_;

  mutable std::mutex mu_;
  InterceptionResult result_;
  // Saves whose bytes arrive after the call returns: (operation, requested, path).
  struct Deferred {
    SaveOperation op;
    std::string requested;
    std::string path;
  };
  std::vector<Deferred> deferred_;

  std::atomic<bool> ended_{false};
  std::atomic<bool> cancelled_{false};
  std::atomic<int64_t> deadline_ns_{0};  // steady_clock epoch ns; 0 = none
};

// The session bound to the calling thread, or nullptr.
InterceptionSession* current_interception();

// Binds a session to the calling thread for the lifetime of this object and
// restores the previous binding on destruction, including during unwinding.
class ScopedInterception {
 public:
  explicit ScopedInterception(InterceptionSession& session);
  ~ScopedInterception();

  ScopedInterception(const ScopedInterception&) = delete;
  ScopedInterception& operator=(const ScopedInterception&) = delete;

 private:
  InterceptionSession& session_;
  InterceptionSession* previous_;
};

// begin/end pair over a shared set of options.
class FileInterceptor {
 public:
  explicit FileInterceptor(InterceptorOptions options) : options_(std::move(options)) {}

  std::unique_ptr<InterceptionSession> begin(const Workspace& workspace) const;
  InterceptionResult end(InterceptionSession& session) const { return session.end(); }

 private:
  InterceptorOptions options_;
};

}  // namespace cellar
