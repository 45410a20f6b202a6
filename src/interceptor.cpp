#include "cellar/interceptor.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>

#include "cellar/audit.hpp"
#include "cellar/log.hpp"
#include "cellar/observability.hpp"
#include "cellar/path_sandbox.hpp"
#include "cellar/workspace_store.hpp"

namespace fs = std::filesystem;

namespace cellar {

namespace {

constexpr const char* kComponent = "interceptor";

thread_local InterceptionSession* t_current = nullptr;

Status write_file(const std::string& path, const std::string& data) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  if (!ofs) return Status::failure(ErrorCode::write_failed, "cannot open " + path);
  ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
  ofs.close();
  if (!ofs) return Status::failure(ErrorCode::write_failed, "short write to " + path);
  return Status::success();
}

void append_field(std::string& out, const std::string& field, char sep) {
  const bool quote = field.find_first_of(std::string(1, sep) + "\"\r\n") != std::string::npos;
  if (!quote) {
    out += field;
    return;
  }
  out += '"';
  for (char c : field) {
    if (c == '"') out += '"';
    out += c;
  }
  out += '"';
}

void append_row(std::string& out, const std::vector<std::string>& row, char sep) {
  for (std::size_t i = 0; i < row.size(); ++i) {
    if (i) out += sep;
    append_field(out, row[i], sep);
  }
  out += '\n';
}

}  // namespace

std::string to_string(SaveOperation op) {
  switch (op) {
    case SaveOperation::open_for_write: return "open_for_write";
    case SaveOperation::export_table: return "export_table";
    case SaveOperation::dump_json: return "dump_json";
    case SaveOperation::write_text: return "write_text";
    case SaveOperation::copy_to_exports: return "copy_to_exports";
    case SaveOperation::export_path: return "export_path";
  }
  return "unknown";
}

Status write_table_delimited(const std::string& path, const Table& table) {
  std::string ext = file_extension(path);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  const char sep = ext == ".tsv" ? '\t' : ',';
  std::string body;
  if (!table.columns.empty()) append_row(body, table.columns, sep);
  for (const auto& row : table.rows) append_row(body, row, sep);
  return write_file(path, body);
}

// ---------------------------------------------------------------------------
// InterceptionSession
// ---------------------------------------------------------------------------

InterceptionSession::InterceptionSession(Workspace workspace, InterceptorOptions options)
    : workspace_(std::move(workspace)), options_(std::move(options)) {
  if (!options_.table_writer) options_.table_writer = write_table_delimited;
  if (!options_.clock) options_.clock = now_unix_ms;
  log_event(LogLevel::debug, kComponent, "interception begun", {{"session_id", workspace_.session_id}});
}

InterceptionSession::~InterceptionSession() {
  if (active()) {
    mark_leak();
    end();
  }
}

void InterceptionSession::mark_leak() {
  global_service_stats().interception_leaks.fetch_add(1, std::memory_order_relaxed);
  log_event(LogLevel::fatal, kComponent, "interception leak", {{"session_id", workspace_.session_id}});
  std::lock_guard<std::mutex> lk(mu_);
  result_.leak_detected = true;
}

bool InterceptionSession::cancelled() const {
  if (cancelled_.load(std::memory_order_acquire)) return true;
  const int64_t deadline = deadline_ns_.load(std::memory_order_acquire);
  if (deadline == 0) return false;
  const auto now = std::chrono::steady_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::nanoseconds>(now).count() >= deadline;
}

void InterceptionSession::set_deadline(std::chrono::steady_clock::time_point deadline) {
  const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(deadline.time_since_epoch()).count();
  deadline_ns_.store(ns == 0 ? 1 : ns, std::memory_order_release);
}

void InterceptionSession::checkpoint() const {
  if (cancelled()) throw ExecutionCancelled();
}

std::vector<std::string> InterceptionSession::produced_files() const {
  std::lock_guard<std::mutex> lk(mu_);
  return result_.produced_files;
}

InterceptionSession::Target InterceptionSession::redirect(SaveOperation op, const std::string& requested,
                                                          uint64_t bytes) {
  checkpoint();
  Target t;
  if (!active()) {
    t.status = Status::failure(ErrorCode::invalid_argument, "interception already ended");
    return t;
  }
  if (!workspace_.valid()) {
    t.status = Status::failure(ErrorCode::invalid_argument, "interception has no workspace");
    return t;
  }
  if (options_.store && options_.max_session_bytes > 0) {
    const uint64_t used = options_.store->session_usage(workspace_.session_id).bytes_used;
    if (used >= options_.max_session_bytes || used + bytes > options_.max_session_bytes) {
      t.status = Status::failure(ErrorCode::quota_exceeded, "session storage limit reached");
      return t;
    }
  }
  const std::string name = sanitize_filename(requested);
  const ReservedPath reserved = reserve_unique_path(workspace_.exports, export_timestamp(options_.clock()), name);
  if (!reserved.ok()) {
    if (reserved.status.code == ErrorCode::path_escape) {
      global_service_stats().path_escapes_blocked.fetch_add(1, std::memory_order_relaxed);
    }
    t.status = reserved.status;
    return t;
  }
  log_event(LogLevel::debug, kComponent, "save redirected",
            {{"session_id", workspace_.session_id}, {"operation", to_string(op)},
             {"path", reserved.path}});
  t.path = reserved.path;
  return t;
}

void InterceptionSession::audit(SaveOperation op, const std::string& requested, const std::string& path,
                                const Status& st, uint64_t bytes) {
  if (!options_.audit) return;
  FileAuditRecord rec;
  rec.session_id = workspace_.session_id;
  rec.operation = to_string(op);
  rec.requested_name = sanitize_filename(requested);
  rec.redirected_path = st.ok() ? path : "";
  rec.ok = st.ok();
  rec.error_code = st.ok() ? "" : to_string(st.code);
  rec.bytes = bytes;
  if (!options_.audit->append(rec)) {
    log_event(LogLevel::warn, kComponent, "audit append failed", {{"session_id", workspace_.session_id}});
  }
}

void InterceptionSession::record_failure(SaveOperation op, const std::string& requested, const Status& st) {
  global_service_stats().saves_failed.fetch_add(1, std::memory_order_relaxed);
  log_event(LogLevel::warn, kComponent, "save failed",
            {{"session_id", workspace_.session_id}, {"operation", to_string(op)},
             {"error", to_string(st.code)}, {"detail", st.message}});
  audit(op, requested, "", st, 0);
  std::lock_guard<std::mutex> lk(mu_);
  result_.failures.push_back(SaveFailure{to_string(op), requested, st.code, st.message});
}

bool InterceptionSession::over_quota() const {
  if (!options_.store || options_.max_session_bytes == 0) return false;
  return options_.store->session_usage(workspace_.session_id).bytes_used > options_.max_session_bytes;
}

Status InterceptionSession::finish_save(SaveOperation op, const std::string& requested, const Target& target,
                                        const Status& write_status, uint64_t bytes) {
  if (!write_status.ok()) {
    std::remove(target.path.c_str());
    record_failure(op, requested, write_status);
    return write_status;
  }
  if (over_quota()) {
    std::remove(target.path.c_str());
    const Status st = Status::failure(ErrorCode::quota_exceeded, "session storage limit exceeded by " + target.path);
    record_failure(op, requested, st);
    return st;
  }
  global_service_stats().saves_redirected.fetch_add(1, std::memory_order_relaxed);
  audit(op, requested, target.path, write_status, bytes);
  std::lock_guard<std::mutex> lk(mu_);
  result_.produced_files.push_back(target.path);
  return write_status;
}

OpenResult InterceptionSession::open_for_write(const std::string& name, bool binary) {
  OpenResult out;
  const Target t = redirect(SaveOperation::open_for_write, name, 0);
  if (!t.status.ok()) {
    record_failure(SaveOperation::open_for_write, name, t.status);
    out.status = t.status;
    return out;
  }
  auto mode = std::ios::out | std::ios::trunc;
  if (binary) mode |= std::ios::binary;
  auto stream = std::make_unique<std::ofstream>(t.path, mode);
  if (!*stream) {
    out.status = Status::failure(ErrorCode::write_failed, "cannot open " + t.path);
    finish_save(SaveOperation::open_for_write, name, t, out.status, 0);
    return out;
  }
  finish_save(SaveOperation::open_for_write, name, t, Status::success(), 0);
  {
    std::lock_guard<std::mutex> lk(mu_);
    deferred_.push_back(Deferred{SaveOperation::open_for_write, name, t.path});
  }
  out.stream = std::move(stream);
  out.path = t.path;
  return out;
}

Status InterceptionSession::export_table(const std::string& name, const Table& table) {
  const Target t = redirect(SaveOperation::export_table, name, 0);
  if (!t.status.ok()) {
    record_failure(SaveOperation::export_table, name, t.status);
    return t.status;
  }
  const Status st = options_.table_writer(t.path, table);
  std::error_code ec;
  const uint64_t size = st.ok() ? static_cast<uint64_t>(fs::file_size(t.path, ec)) : 0;
  return finish_save(SaveOperation::export_table, name, t, st, ec ? 0 : size);
}

Status InterceptionSession::dump_json(const std::string& name, const jsonlite::Value& value) {
  const std::string body = jsonlite::to_json(value);
  const Target t = redirect(SaveOperation::dump_json, name, body.size());
  if (!t.status.ok()) {
    record_failure(SaveOperation::dump_json, name, t.status);
    return t.status;
  }
  return finish_save(SaveOperation::dump_json, name, t, write_file(t.path, body), body.size());
}

Status InterceptionSession::write_text(const std::string& name, const std::string& text) {
  const Target t = redirect(SaveOperation::write_text, name, text.size());
  if (!t.status.ok()) {
    record_failure(SaveOperation::write_text, name, t.status);
    return t.status;
  }
  return finish_save(SaveOperation::write_text, name, t, write_file(t.path, text), text.size());
}

Status InterceptionSession::copy_to_exports(const std::string& source, const std::string& name) {
  const SaveOperation op = SaveOperation::copy_to_exports;
  const std::string requested = name.empty() ? fs::path(source).filename().string() : name;
  checkpoint();
  const PathResolution src = resolve_path(source, workspace_.root);
  if (!src.ok()) {
    if (src.error == ErrorCode::path_escape) {
      global_service_stats().path_escapes_blocked.fetch_add(1, std::memory_order_relaxed);
    }
    const Status st = Status::failure(src.error, "copy source not in workspace: " + source);
    record_failure(op, requested, st);
    return st;
  }
  std::error_code ec;
  if (!fs::is_regular_file(src.path, ec)) {
    const Status st = Status::failure(ErrorCode::not_found, "copy source not found: " + source);
    record_failure(op, requested, st);
    return st;
  }
  const uint64_t size = static_cast<uint64_t>(fs::file_size(src.path, ec));
  const Target t = redirect(op, requested, ec ? 0 : size);
  if (!t.status.ok()) {
    record_failure(op, requested, t.status);
    return t.status;
  }
  fs::copy_file(src.path, t.path, fs::copy_options::overwrite_existing, ec);
  const Status st = ec ? Status::failure(ErrorCode::write_failed, t.path + ": " + ec.message()) : Status::success();
  return finish_save(op, requested, t, st, size);
}

PathResolution InterceptionSession::export_path(const std::string& name) {
  PathResolution out;
  const Target t = redirect(SaveOperation::export_path, name, 0);
  if (!t.status.ok()) {
    record_failure(SaveOperation::export_path, name, t.status);
    out.error = t.status.code;
    out.detail = t.status.message;
    return out;
  }
  const Status st = finish_save(SaveOperation::export_path, name, t, Status::success(), 0);
  if (!st.ok()) {
    out.error = st.code;
    out.detail = st.message;
    return out;
  }
  {
    std::lock_guard<std::mutex> lk(mu_);
    deferred_.push_back(Deferred{SaveOperation::export_path, name, t.path});
  }
  out.path = t.path;
  return out;
}

PathResolution InterceptionSession::temp_path(const std::string& name) const {
  if (!workspace_.valid()) {
    PathResolution out;
    out.error = ErrorCode::invalid_argument;
    out.detail = "interception has no workspace";
    return out;
  }
  return resolve_path(sanitize_filename(name), workspace_.temp);
}

void InterceptionSession::enforce_deferred_quota() {
  std::vector<Deferred> deferred;
  {
    std::lock_guard<std::mutex> lk(mu_);
    deferred.swap(deferred_);
  }
  for (auto it = deferred.rbegin(); it != deferred.rend() && over_quota(); ++it) {
    std::error_code ec;
    fs::remove(it->path, ec);
    record_failure(it->op, it->requested,
                   Status::failure(ErrorCode::quota_exceeded, "session storage limit exceeded by " + it->path));
    std::lock_guard<std::mutex> lk(mu_);
    auto& produced = result_.produced_files;
    produced.erase(std::remove(produced.begin(), produced.end(), it->path), produced.end());
  }
}

InterceptionResult InterceptionSession::end() {
  const bool was_active = !ended_.exchange(true, std::memory_order_acq_rel);
  if (was_active) enforce_deferred_quota();
  std::lock_guard<std::mutex> lk(mu_);
  if (was_active) {
    log_event(LogLevel::debug, kComponent, "interception ended",
              {{"session_id", workspace_.session_id},
               {"produced", std::to_string(result_.produced_files.size())},
               {"failed", std::to_string(result_.failures.size())}});
  }
  return result_;
}

// ---------------------------------------------------------------------------
// Thread binding
// ---------------------------------------------------------------------------

InterceptionSession* current_interception() { return t_current; }

ScopedInterception::ScopedInterception(InterceptionSession& session)
    : session_(session), previous_(t_current) {
  t_current = &session_;
}

ScopedInterception::~ScopedInterception() {
  if (t_current != &session_) {
    session_.mark_leak();
  }
  t_current = previous_;
}

std::unique_ptr<InterceptionSession> FileInterceptor::begin(const Workspace& workspace) const {
  return std::make_unique<InterceptionSession>(workspace, options_);
}

}  // namespace cellar
