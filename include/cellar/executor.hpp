#pragma once

// cellar/executor.hpp — Runs one piece of user code inside an interception.
//
// Executor::run is the only sanctioned way to execute code against a
// workspace. It guarantees, for every outcome (normal return, thrown
// exception, cancellation, deadline), that:
//   - the interception is ended and its produced files returned;
//   - the thread binding made for cellar::fileops is released;
//   - no exception escapes run().
//
// Cancellation is cooperative: the deadline and CancellationSource::cancel()
// take effect at the next interception call or ExecutionContext::checkpoint().
// Code that never calls either runs to completion.

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "cellar/interceptor.hpp"
#include "cellar/types.hpp"

namespace cellar {

using Variables = std::map<std::string, Table>;

class ExecutionContext {
 public:
  ExecutionContext(InterceptionSession& session, const Variables& variables)
      : session_(session), variables_(variables) {}

  const Workspace& workspace() const { return session_.workspace(); }
  const Variables& variables() const { return variables_; }

  OpenResult open_for_write(const std::string& name, bool binary = false) {
    return session_.open_for_write(name, binary);
  }
  Status export_table(const std::string& name, const Table& table) { return session_.export_table(name, table); }
  Status dump_json(const std::string& name, const jsonlite::Value& value) { return session_.dump_json(name, value); }
  Status write_text(const std::string& name, const std::string& text) { return session_.write_text(name, text); }
  Status copy_to_exports(const std::string& source, const std::string& name = "") {
    return session_.copy_to_exports(source, name);
  }
  PathResolution export_path(const std::string& name) { return session_.export_path(name); }
  PathResolution temp_path(const std::string& name) const { return session_.temp_path(name); }

  // Files produced so far in this execution, in call order.
  std::vector<std::string> produced_files() const { return session_.produced_files(); }

  // Throws ExecutionCancelled once cancelled or past the deadline.
  void checkpoint() const { session_.checkpoint(); }

 private:
  InterceptionSession& session_;
  const Variables& variables_;
};

using ExecutionFn = std::function<void(ExecutionContext&)>;

// Shared between the caller that may cancel and the thread running the code.
class CancellationSource {
 public:
  void cancel();
  bool cancelled() const;

 private:
  friend class Executor;
  void attach(InterceptionSession* session);
  void detach();

  mutable std::mutex mu_;
  bool cancelled_{false};
  InterceptionSession* session_{nullptr};
};

struct ExecutionResult {
  bool ok{false};
  std::string error_code;     // "" | cancelled | user_exception
  std::string error_message;
  std::vector<std::string> produced_files;
  std::vector<SaveFailure> failed_saves;
  bool leak_detected{false};
  uint64_t duration_ns{0};
};

class Executor {
 public:
  explicit Executor(const FileInterceptor& interceptor) : interceptor_(interceptor) {}

  // timeout of zero means no deadline.
  ExecutionResult run(const Workspace& workspace, const ExecutionFn& code,
                      std::chrono::milliseconds timeout, const Variables& variables = {},
                      std::shared_ptr<CancellationSource> cancel = nullptr) const;

 private:
  const FileInterceptor& interceptor_;
};

}  // namespace cellar
