#include "cellar/executor.hpp"

#include <exception>

#include "cellar/log.hpp"
#include "cellar/observability.hpp"

namespace cellar {

namespace {
constexpr const char* kComponent = "executor";
}  // namespace

void CancellationSource::cancel() {
  std::lock_guard<std::mutex> lk(mu_);
  cancelled_ = true;
  if (session_) session_->cancel();
}

bool CancellationSource::cancelled() const {
  std::lock_guard<std::mutex> lk(mu_);
  return cancelled_;
}

void CancellationSource::attach(InterceptionSession* session) {
  std::lock_guard<std::mutex> lk(mu_);
  session_ = session;
  if (cancelled_) session_->cancel();
}

void CancellationSource::detach() {
  std::lock_guard<std::mutex> lk(mu_);
  session_ = nullptr;
}

ExecutionResult Executor::run(const Workspace& workspace, const ExecutionFn& code,
                              std::chrono::milliseconds timeout, const Variables& variables,
                              std::shared_ptr<CancellationSource> cancel) const {
  auto& stats = global_service_stats();
  stats.executions_total.fetch_add(1, std::memory_order_relaxed);
  const auto start = std::chrono::steady_clock::now();

  ExecutionResult r;
  auto session = interceptor_.begin(workspace);
  if (timeout.count() > 0) session->set_deadline(start + timeout);
  if (cancel) cancel->attach(session.get());

  {
    ScopedInterception bind(*session);
    ExecutionContext ctx(*session, variables);
    try {
      if (!code) throw std::invalid_argument("no code to execute");
      code(ctx);
      r.ok = true;
    } catch (const ExecutionCancelled&) {
      r.error_code = to_string(ErrorCode::cancelled);
      r.error_message = session->cancelled() ? "execution cancelled or timed out" : "execution cancelled";
    } catch (const std::exception& e) {
      r.error_code = "user_exception";
      r.error_message = e.what();
    } catch (...) {
      r.error_code = "user_exception";
      r.error_message = "non-standard exception";
    }
  }

  if (cancel) cancel->detach();
  const InterceptionResult ir = session->end();
  r.produced_files = ir.produced_files;
  r.failed_saves = ir.failures;
  r.leak_detected = ir.leak_detected;
  r.duration_ns = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - start).count());

  stats.execution_latency.record(r.duration_ns);
  if (!r.ok) {
    stats.executions_failed.fetch_add(1, std::memory_order_relaxed);
    if (r.error_code == to_string(ErrorCode::cancelled)) {
      stats.executions_cancelled.fetch_add(1, std::memory_order_relaxed);
    }
  }
  log_event(r.ok ? LogLevel::info : LogLevel::warn, kComponent, "execution finished",
            {{"session_id", workspace.session_id},
             {"ok", r.ok ? "true" : "false"},
             {"error_code", r.error_code},
             {"produced", std::to_string(r.produced_files.size())},
             {"failed_saves", std::to_string(r.failed_saves.size())}});
  return r;
}

}  // namespace cellar
