#include <chrono>
#include <cstdint>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

#include "cellar/config.hpp"
#include "cellar/hash.hpp"
#include "cellar/jsonlite.hpp"
#include "cellar/service.hpp"
#include "cellar/session_identity.hpp"
#include "cellar/version.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFailure = 2;

struct Args {
  std::string cmd;
  std::vector<std::string> positional;
  std::map<std::string, std::string> opts;
};

// Every --flag takes exactly one value.
bool parse_args(int argc, char** argv, Args& out) {
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a.rfind("--", 0) == 0) {
      if (i + 1 >= argc) return false;
      out.opts[a.substr(2)] = argv[++i];
    } else if (out.cmd.empty()) {
      out.cmd = a;
    } else {
      out.positional.push_back(a);
    }
  }
  return !out.cmd.empty();
}

std::string opt(const Args& a, const std::string& key, const std::string& def = "") {
  auto it = a.opts.find(key);
  return it == a.opts.end() ? def : it->second;
}

int fail(const cellar::Status& st) {
  std::cerr << "{\"error\":\"" << cellar::to_string(st.code) << "\",\"message\":\""
            << cellar::jsonlite::escape(st.message) << "\"}\n";
  return kExitFailure;
}

int usage(const std::string& msg) {
  std::cerr << "{\"error\":\"usage\",\"message\":\"" << cellar::jsonlite::escape(msg) << "\"}\n";
  return kExitUsage;
}

void print_usage() {
  std::cerr << "usage: cellar <command> [--base-dir DIR] [--config FILE]\n"
               "  health | version | stats | config-check\n"
               "  derive --user-agent UA [--platform P] [--token T]\n"
               "  ensure <id> | exports <id> | uploads <id> | purge <id> | redact <id>\n"
               "  sweep [--ttl-hours N]\n";
}

std::string exports_json(const std::vector<cellar::ExportEntry>& entries) {
  std::ostringstream o;
  o << "[";
  for (std::size_t i = 0; i < entries.size(); ++i) {
    const auto& e = entries[i];
    if (i) o << ",";
    o << "{\"name\":\"" << cellar::jsonlite::escape(e.name) << "\""
      << ",\"path\":\"" << cellar::jsonlite::escape(e.path) << "\""
      << ",\"size\":" << e.size << ",\"mtime_unix_ms\":" << e.mtime_unix_ms << "}";
  }
  o << "]";
  return o.str();
}

std::string uploads_json(const std::vector<cellar::UploadEntry>& entries) {
  std::ostringstream o;
  o << "[";
  for (std::size_t i = 0; i < entries.size(); ++i) {
    const auto& e = entries[i];
    if (i) o << ",";
    o << "{\"name\":\"" << cellar::jsonlite::escape(e.name) << "\""
      << ",\"display_name\":\"" << cellar::jsonlite::escape(e.display_name) << "\""
      << ",\"kind\":\"" << cellar::to_string(e.kind) << "\""
      << ",\"path\":\"" << cellar::jsonlite::escape(e.path) << "\""
      << ",\"size\":" << e.size << ",\"mtime_unix_ms\":" << e.mtime_unix_ms << "}";
  }
  o << "]";
  return o.str();
}

}  // namespace

int main(int argc, char** argv) {
  Args args;
  if (!parse_args(argc, argv, args)) {
    print_usage();
    return kExitUsage;
  }
  const std::string& cmd = args.cmd;

  if (cmd == "health") {
    const auto h = cellar::hash_runtime_info();
    std::cout << "{\"ok\":true"
              << ",\"hash_primitive\":\"" << h.primitive << "\""
              << ",\"hash_backend\":\"" << h.backend << "\""
              << ",\"hash_version\":\"" << h.version << "\""
              << ",\"hash_available\":" << (h.blake3_available ? "true" : "false")
              << ",\"workspace_layout_version\":" << cellar::version::WORKSPACE_LAYOUT_VERSION
              << "}\n";
    return kExitOk;
  }

  if (cmd == "version") {
    std::cout << cellar::version::manifest_to_json(cellar::version::current_manifest()) << "\n";
    return kExitOk;
  }

  if (cmd == "derive") {
    cellar::ClientSignature sig;
    sig.user_agent = opt(args, "user-agent");
    sig.platform = opt(args, "platform");
    sig.client_token = opt(args, "token");
    if (sig.user_agent.empty() && sig.client_token.empty()) {
      return usage("derive needs --user-agent or --token");
    }
    const auto now = cellar::now_unix_ms();
    std::cout << "{\"session_id\":\"" << cellar::derive_session_id(sig, now) << "\""
              << ",\"hour_bucket\":" << cellar::hour_bucket(now)
              << ",\"mode\":\"" << (sig.client_token.empty() ? "signature" : "token") << "\"}\n";
    return kExitOk;
  }

  auto loaded = cellar::load_config(opt(args, "config"));
  if (!loaded.ok()) return fail(loaded.status);
  cellar::CellarConfig cfg = loaded.config;
  if (const auto dir = opt(args, "base-dir"); !dir.empty()) cfg.base_dir = dir;
  // The CLI is a one-shot process: no background reaper, no implicit sweep.
  cfg.reaper_enabled = false;
  cfg.sweep_on_startup = false;

  if (cmd == "config-check") {
    const auto v = cellar::validate_config(cfg);
    std::ostringstream o;
    o << "{\"ok\":" << (v.ok ? "true" : "false") << ",\"source\":\""
      << cellar::jsonlite::escape(loaded.source) << "\",\"errors\":[";
    for (std::size_t i = 0; i < v.errors.size(); ++i) {
      o << (i ? "," : "") << "\"" << cellar::jsonlite::escape(v.errors[i]) << "\"";
    }
    o << "],\"warnings\":[";
    for (std::size_t i = 0; i < v.warnings.size(); ++i) {
      o << (i ? "," : "") << "\"" << cellar::jsonlite::escape(v.warnings[i]) << "\"";
    }
    o << "],\"config\":" << cellar::config_to_json(cfg) << "}\n";
    std::cout << o.str();
    return v.ok ? kExitOk : kExitFailure;
  }

  cellar::SessionService svc(cfg);
  if (const auto st = svc.open(); !st.ok()) return fail(st);

  const bool needs_id = cmd == "ensure" || cmd == "exports" || cmd == "uploads" || cmd == "purge" ||
                        cmd == "redact";
  if (needs_id && args.positional.empty()) return usage(cmd + " needs a session id");
  const std::string id = needs_id ? args.positional.front() : "";
  if (needs_id && !cellar::is_valid_session_id(id)) {
    return fail(cellar::Status::failure(cellar::ErrorCode::invalid_session_id, "malformed session id"));
  }

  if (cmd == "ensure") {
    const auto r = svc.ensure_workspace(id);
    if (!r.ok()) return fail(r.status);
    std::cout << "{\"session_id\":\"" << id << "\",\"created\":" << (r.created ? "true" : "false")
              << ",\"root\":\"" << cellar::jsonlite::escape(r.workspace.root) << "\""
              << ",\"uploads\":\"" << cellar::jsonlite::escape(r.workspace.uploads) << "\""
              << ",\"exports\":\"" << cellar::jsonlite::escape(r.workspace.exports) << "\""
              << ",\"temp\":\"" << cellar::jsonlite::escape(r.workspace.temp) << "\"}\n";
    return kExitOk;
  }

  if (cmd == "exports") {
    if (!svc.store().exists(id)) return fail(cellar::Status::failure(cellar::ErrorCode::not_found, "no workspace"));
    std::cout << "{\"session_id\":\"" << id << "\",\"exports\":" << exports_json(svc.list_exports(id)) << "}\n";
    return kExitOk;
  }

  if (cmd == "uploads") {
    if (!svc.store().exists(id)) return fail(cellar::Status::failure(cellar::ErrorCode::not_found, "no workspace"));
    const auto usage_now = svc.session_usage(id);
    std::cout << "{\"session_id\":\"" << id << "\",\"bytes_used\":" << usage_now.bytes_used
              << ",\"uploads\":" << uploads_json(svc.list_uploads(id)) << "}\n";
    return kExitOk;
  }

  if (cmd == "purge") {
    if (const auto st = svc.purge_session(id); !st.ok()) return fail(st);
    std::cout << "{\"session_id\":\"" << id << "\",\"purged\":true}\n";
    return kExitOk;
  }

  if (cmd == "redact") {
    cellar::ConfigRecord rec;
    if (!svc.store().exists(id)) return fail(cellar::Status::failure(cellar::ErrorCode::not_found, "no workspace"));
    if (const auto st = svc.load_config(id, rec); !st.ok()) return fail(st);
    std::cout << cellar::redacted_config_to_json(svc.client_view(rec), cellar::now_unix_ms()) << "\n";
    return kExitOk;
  }

  if (cmd == "stats") {
    const auto usage_now = svc.store().total_usage();
    std::cout << "{\"sessions_on_disk\":" << usage_now.session_count
              << ",\"bytes_used\":" << usage_now.bytes_used
              << ",\"detail\":" << svc.stats_json() << "}\n";
    return kExitOk;
  }

  if (cmd == "sweep") {
    std::chrono::milliseconds ttl = cfg.session_ttl;
    if (const auto h = opt(args, "ttl-hours"); !h.empty()) {
      uint64_t hours = 0;
      if (!cellar::parse_u64(h, hours)) return usage("--ttl-hours must be a non-negative integer");
      ttl = std::chrono::hours(hours);
    }
    const std::size_t purged = svc.sweep_now(ttl);
    std::cout << "{\"purged\":" << purged << ",\"remaining\":" << svc.registry().size() << "}\n";
    return kExitOk;
  }

  print_usage();
  return kExitUsage;
}
