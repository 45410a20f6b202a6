#include "cellar/service.hpp"

#include "cellar/log.hpp"
#include "cellar/observability.hpp"

namespace cellar {

namespace {

constexpr const char* kComponent = "service";
constexpr int kEnsureAttempts = 8;

InterceptorOptions interceptor_options(WorkspaceStore& store, FileAuditLog* audit, const CellarConfig& cfg) {
  InterceptorOptions o;
  o.store = &store;
  o.audit = audit;
  o.max_session_bytes = cfg.max_storage_per_session_bytes;
  return o;
}

}  // namespace

SessionService::SessionService(CellarConfig cfg, SessionRegistry::Clock clock)
    : cfg_(std::move(cfg)),
      clock_(clock ? std::move(clock) : SessionRegistry::Clock(now_unix_ms)),
      store_(cfg_),
      audit_(std::make_unique<FileAuditLog>(cfg_.audit_log_path)),
      registry_(store_, clock_),
      interceptor_(interceptor_options(store_, audit_.get(), cfg_)),
      executor_(interceptor_) {}

SessionService::~SessionService() { stop(); }

Status SessionService::open() {
  if (opened_) return Status::success();
  const ConfigValidation v = validate_config(cfg_);
  for (const auto& w : v.warnings) log_event(LogLevel::warn, kComponent, "config warning", {{"detail", w}});
  if (!v.ok) {
    for (const auto& e : v.errors) log_event(LogLevel::error, kComponent, "config error", {{"detail", e}});
    return Status::failure(ErrorCode::config_invalid, v.errors.front());
  }
  const Status st = store_.init();
  if (!st.ok()) return st;

  std::size_t adopted = 0;
  for (const auto& [id, mtime] : store_.scan()) {
    if (registry_.adopt(id, mtime, mtime)) ++adopted;
  }
  log_event(LogLevel::info, kComponent, "opened",
            {{"base_dir", store_.base_dir()}, {"adopted", std::to_string(adopted)},
             {"audit", audit_->enabled() ? audit_->path() : ""}});
  opened_ = true;
  return Status::success();
}

Status SessionService::start() {
  const Status st = open();
  if (!st.ok()) return st;
  if (cfg_.sweep_on_startup) registry_.sweep(cfg_.session_ttl);
  if (cfg_.reaper_enabled && !reaper_) {
    reaper_ = std::make_unique<Reaper>(registry_, cfg_.sweep_interval, cfg_.session_ttl);
    reaper_->start();
  }
  return Status::success();
}

void SessionService::stop() {
  if (reaper_) {
    reaper_->stop();
    reaper_.reset();
  }
}

SessionId SessionService::derive_or_accept(const ClientSignature& sig, const std::string& existing) const {
  return cellar::derive_or_accept(sig, existing, clock_());
}

EnsureResult SessionService::ensure_workspace(const SessionId& id) {
  if (!is_valid_session_id(id)) {
    EnsureResult out;
    out.status = Status::failure(ErrorCode::invalid_session_id, "malformed session id");
    return out;
  }
  // A sweep that expires the record between touch and ensure would leave the
  // recreated directory unregistered; re-touch until both agree.
  EnsureResult out;
  for (int attempt = 0; attempt < kEnsureAttempts; ++attempt) {
    registry_.touch(id);
    out = store_.ensure(id);
    if (!out.ok() || registry_.find(id)) return out;
  }
  log_event(LogLevel::warn, kComponent, "workspace registered after repeated expiry", {{"session_id", id}});
  registry_.touch(id);
  return out;
}

std::vector<ExportEntry> SessionService::list_exports(const SessionId& id) const {
  return store_.list_exports(id);
}

Status SessionService::purge_session(const SessionId& id) { return registry_.purge(id); }

std::unique_ptr<InterceptionSession> SessionService::begin_interception(const Workspace& workspace) const {
  if (!(store_.layout(workspace.session_id) == workspace)) {
    log_event(LogLevel::error, kComponent, "interception refused: foreign workspace",
              {{"session_id", workspace.session_id}});
    return interceptor_.begin(Workspace{});
  }
  return interceptor_.begin(workspace);
}

InterceptionResult SessionService::end_interception(InterceptionSession& session) const {
  return interceptor_.end(session);
}

ExecutionResult SessionService::execute(const SessionId& id, const ExecutionFn& code, const Variables& variables,
                                        std::shared_ptr<CancellationSource> cancel) {
  const EnsureResult ens = ensure_workspace(id);
  if (!ens.ok()) {
    ExecutionResult r;
    r.error_code = to_string(ens.status.code);
    r.error_message = ens.status.message;
    return r;
  }
  return executor_.run(ens.workspace, code, cfg_.execution_timeout, variables, std::move(cancel));
}

Status SessionService::load_config(const SessionId& id, ConfigRecord& out) const {
  const Status st = store_.load_config(id, out);
  if (st.code == ErrorCode::not_found) {
    out = ConfigRecord{};
    return Status::success();
  }
  return st;
}

Status SessionService::save_config(const SessionId& id, const ConfigRecord& cfg) {
  // Registers the session first so the reaper owns the workspace it creates.
  const EnsureResult ens = ensure_workspace(id);
  if (!ens.ok()) return ens.status;
  const Status st = store_.save_config(id, cfg);
  if (!st.ok()) return st;
  return store_.save_client_view(id, cfg);
}

RedactedConfig SessionService::client_view(const ConfigRecord& cfg) const {
  return redact(cfg, cfg_.sensitive_keys);
}

UploadResult SessionService::save_upload(const SessionId& id, const std::string& original_name,
                                         const std::string& bytes) {
  if (is_valid_session_id(id)) registry_.touch(id);
  return store_.save_upload(id, original_name, bytes);
}

std::vector<UploadEntry> SessionService::list_uploads(const SessionId& id) const { return store_.list_uploads(id); }

std::optional<UploadEntry> SessionService::find_upload(const SessionId& id, const std::string& name) const {
  return store_.find_upload(id, name);
}

PathResolution SessionService::temp_path(const SessionId& id, const std::string& name) const {
  return store_.temp_path(id, name);
}

SessionUsage SessionService::session_usage(const SessionId& id) const { return store_.session_usage(id); }

std::size_t SessionService::sweep_now() { return registry_.sweep(cfg_.session_ttl); }

std::size_t SessionService::sweep_now(std::chrono::milliseconds ttl) { return registry_.sweep(ttl); }

RegistryStats SessionService::stats() const { return registry_.stats(); }

std::string SessionService::stats_json() const {
  const RegistryStats rs = stats();
  std::string out;
  out.reserve(768);
  out += "{\"registry\":{\"active_sessions\":";
  out += std::to_string(rs.active_sessions);
  out += ",\"total_bytes\":";
  out += std::to_string(rs.total_bytes);
  out += ",\"max_total_bytes\":";
  out += std::to_string(cfg_.max_total_storage_bytes);
  out += "},\"audit\":{\"enabled\":";
  out += audit_->enabled() ? "true" : "false";
  out += ",\"entries\":";
  out += std::to_string(audit_->entry_count());
  out += ",\"failures\":";
  out += std::to_string(audit_->failure_count());
  out += "},\"reaper_running\":";
  out += reaper_running() ? "true" : "false";
  out += ",\"service\":";
  out += global_service_stats().to_json();
  out += "}";
  return out;
}

}  // namespace cellar
