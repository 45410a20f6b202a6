#pragma once

// cellar/service.hpp — Facade handed to the request-handling layer.
//
// One SessionService per process. It owns the store, the registry, the
// interceptor, the executor, the optional audit trail and the reaper.
//
// LIFECYCLE:
//   SessionService svc(cfg);
//   svc.open();   // base dir + adoption of existing workspaces
//   svc.start();  // open() + startup sweep + reaper thread (per config)
//   ...
//   svc.stop();   // joins the reaper; also run by the destructor
//
// Request path:
//   id = derive_or_accept(sig, cookie)
//   ws = ensure_workspace(id)        // touch + ensure
//   r  = execute(id, code, vars)     // begin/end around the code
//   list_exports(id)

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cellar/audit.hpp"
#include "cellar/config.hpp"
#include "cellar/executor.hpp"
#include "cellar/interceptor.hpp"
#include "cellar/reaper.hpp"
#include "cellar/session_identity.hpp"
#include "cellar/session_registry.hpp"
#include "cellar/types.hpp"
#include "cellar/user_config.hpp"
#include "cellar/workspace_store.hpp"

namespace cellar {

class SessionService {
 public:
  explicit SessionService(CellarConfig cfg, SessionRegistry::Clock clock = {});
  ~SessionService();

  SessionService(const SessionService&) = delete;
  SessionService& operator=(const SessionService&) = delete;

  Status open();
  Status start();
  void stop();

  SessionId derive_or_accept(const ClientSignature& sig, const std::string& existing = "") const;
  EnsureResult ensure_workspace(const SessionId& id);
  std::vector<ExportEntry> list_exports(const SessionId& id) const;
  Status purge_session(const SessionId& id);

  // The workspace must be one this service handed out; any other value yields
  // a session whose every save is refused.
  std::unique_ptr<InterceptionSession> begin_interception(const Workspace& workspace) const;
  InterceptionResult end_interception(InterceptionSession& session) const;

  ExecutionResult execute(const SessionId& id, const ExecutionFn& code, const Variables& variables = {},
                          std::shared_ptr<CancellationSource> cancel = nullptr);

  // A missing config.json yields the defaults with a success status.
  Status load_config(const SessionId& id, ConfigRecord& out) const;
  // Writes config.json and the matching client_view.json.
  Status save_config(const SessionId& id, const ConfigRecord& cfg);
  RedactedConfig client_view(const ConfigRecord& cfg) const;

  UploadResult save_upload(const SessionId& id, const std::string& original_name, const std::string& bytes);
  std::vector<UploadEntry> list_uploads(const SessionId& id) const;
  std::optional<UploadEntry> find_upload(const SessionId& id, const std::string& name) const;
  PathResolution temp_path(const SessionId& id, const std::string& name = "") const;
  SessionUsage session_usage(const SessionId& id) const;

  std::size_t sweep_now();
  std::size_t sweep_now(std::chrono::milliseconds ttl);
  RegistryStats stats() const;
  std::string stats_json() const;

  const CellarConfig& config() const { return cfg_; }
  WorkspaceStore& store() { return store_; }
  SessionRegistry& registry() { return registry_; }
  bool reaper_running() const { return reaper_ && reaper_->running(); }

 private:
  CellarConfig cfg_;
  SessionRegistry::Clock clock_;
  WorkspaceStore store_;
  std::unique_ptr<FileAuditLog> audit_;
  SessionRegistry registry_;
  FileInterceptor interceptor_;
  Executor executor_;
  std::unique_ptr<Reaper> reaper_;
  bool opened_{false};
};

}  // namespace cellar
