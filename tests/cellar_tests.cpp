#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "cellar/audit.hpp"
#include "cellar/config.hpp"
#include "cellar/executor.hpp"
#include "cellar/file_ops.hpp"
#include "cellar/hash.hpp"
#include "cellar/interceptor.hpp"
#include "cellar/jsonlite.hpp"
#include "cellar/log.hpp"
#include "cellar/observability.hpp"
#include "cellar/path_sandbox.hpp"
#include "cellar/reaper.hpp"
#include "cellar/service.hpp"
#include "cellar/session_identity.hpp"
#include "cellar/session_registry.hpp"
#include "cellar/user_config.hpp"
#include "cellar/version.hpp"
#include "cellar/workspace_store.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

// Log capture keeps test output readable and lets tests assert on records.
std::mutex g_log_mu;
std::vector<cellar::LogRecord> g_logs;

void capture_log(const cellar::LogRecord& r) {
  std::lock_guard<std::mutex> lk(g_log_mu);
  g_logs.push_back(r);
}

std::size_t count_logs(cellar::LogLevel level, const std::string& msg) {
  std::lock_guard<std::mutex> lk(g_log_mu);
  std::size_t n = 0;
  for (const auto& r : g_logs) {
    if (r.level == level && r.msg == msg) ++n;
  }
  return n;
}

fs::path fresh_dir(const std::string& name) {
  const fs::path p = fs::temp_directory_path() / ("cellar_test_" + name);
  std::error_code ec;
  fs::remove_all(p, ec);
  fs::create_directories(p);
  return p;
}

cellar::CellarConfig test_config(const fs::path& base) {
  cellar::CellarConfig c;
  c.base_dir = base.string();
  c.reaper_enabled = false;
  c.sweep_on_startup = false;
  return c;
}

std::string read_all(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void write_all(const std::string& path, const std::string& data) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << data;
}

// {14-digit-timestamp}_{original}
bool is_export_name(const std::string& filename, const std::string& original) {
  if (filename.size() != 15 + original.size()) return false;
  for (int i = 0; i < 14; ++i) {
    if (filename[i] < '0' || filename[i] > '9') return false;
  }
  return filename[14] == '_' && filename.substr(15) == original;
}

std::size_t count_files(const std::string& dir) {
  std::size_t n = 0;
  std::error_code ec;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) ++n;
  return n;
}

cellar::Workspace make_workspace(cellar::WorkspaceStore& store, const std::string& id) {
  const auto r = store.ensure(id);
  expect(r.ok(), "ensure " + id + ": " + r.status.message);
  return r.workspace;
}

// ============================================================================
// Hashing and JSON
// ============================================================================

void test_blake3_known_vectors() {
  expect(cellar::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(cellar::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_hash_domain_separation() {
  expect(cellar::session_signature_hash("x") != cellar::client_token_hash("x"), "sid vs tok domains differ");
  expect(cellar::client_token_hash("x") != cellar::audit_chain_hash("x"), "tok vs aud domains differ");
  expect(cellar::session_signature_hash("x").size() == 64, "hex digest length");
}

void test_json_sorted_roundtrip() {
  std::optional<cellar::jsonlite::JsonError> err;
  const auto obj = cellar::jsonlite::parse(R"({"b":1,"a":[true,null,"x"],"c":{"d":2.5}})", &err);
  expect(!err, "parse ok");
  expect(cellar::jsonlite::to_json(obj) == R"({"a":[true,null,"x"],"b":1,"c":{"d":2.5}})",
         "keys serialize sorted");
}

void test_json_rejects_duplicates_and_nan() {
  std::optional<cellar::jsonlite::JsonError> err;
  cellar::jsonlite::parse(R"({"a":1,"a":2})", &err);
  expect(err && err->code == "json_duplicate_key", "duplicate key rejected");
  err.reset();
  cellar::jsonlite::parse(R"({"a":NaN})", &err);
  expect(err.has_value(), "NaN rejected");
  err.reset();
  cellar::jsonlite::parse(R"({"a":1} trailing)", &err);
  expect(err.has_value(), "trailing data rejected");
}

void test_json_unicode_escapes() {
  std::optional<cellar::jsonlite::JsonError> err;
  auto v = cellar::jsonlite::parse(R"({"s":"\ud83d\ude00","e":"\u00e9"})", &err);
  expect(!err, "surrogate pair parses");
  expect(cellar::jsonlite::get_string(v, "s", "") == "\xF0\x9F\x98\x80", "pair decodes to one 4-byte sequence");
  expect(cellar::jsonlite::get_string(v, "e", "") == "\xC3\xA9", "bmp escape");
  for (const char* bad : {R"({"s":"\ud83d"})", R"({"s":"\ud83dx"})", R"({"s":"\ude00"})", R"({"s":"a\u0000b"})"}) {
    err.reset();
    cellar::jsonlite::parse(bad, &err);
    expect(err.has_value(), std::string("invalid escape rejected: ") + bad);
  }
}

void test_json_double_precision() {
  expect(cellar::jsonlite::format_double(0.1) == "0.1", "short form kept");
  expect(cellar::jsonlite::format_double(1.0) == "1.0", "integral double stays a double");
  for (double d : {0.1234567, 1.0 / 3.0, 0.7, 1e-9, 123456789.123456789, 1.999999999}) {
    cellar::jsonlite::Object o;
    o["d"] = d;
    std::optional<cellar::jsonlite::JsonError> err;
    const auto back = cellar::jsonlite::parse(cellar::jsonlite::to_json(o), &err);
    expect(!err && cellar::jsonlite::get_double(back, "d", -1.0) == d,
           "double survives text: " + cellar::jsonlite::format_double(d));
  }
}

void test_log_record_json() {
  cellar::LogRecord r;
  r.ts_ms = 5;
  r.level = cellar::LogLevel::warn;
  r.component = "test";
  r.msg = "say \"hi\"";
  r.fields = {{"k", "v"}};
  expect(cellar::log_record_to_json(r) ==
             R"({"ts_ms":5,"level":"warn","component":"test","msg":"say \"hi\"","k":"v"})",
         "log line format");
  expect(cellar::log_level_from_string("fatal") == cellar::LogLevel::fatal, "level parse");
  expect(cellar::log_level_from_string("bogus") == cellar::LogLevel::info, "unknown level -> info");
}

void test_latency_histogram() {
  cellar::LatencyHistogram h;
  for (int i = 0; i < 10; ++i) h.record(1'000'000);  // 1ms
  expect(h.count() == 10, "histogram count");
  expect(h.mean_us() == 1000.0, "histogram mean");
  const double p50 = h.percentile(0.5);
  expect(p50 >= 512.0 && p50 <= 2048.0, "p50 within 1ms bucket");
}

// ============================================================================
// PathSandbox
// ============================================================================

void test_resolve_descendant() {
  const auto root = fresh_dir("sandbox_desc");
  const auto r = cellar::resolve_path("a/b/../c.txt", root.string());
  const auto s = cellar::resolve_path("a/c.txt", root.string());
  expect(r.ok() && s.ok(), "relative paths resolve");
  expect(r.path == s.path, "a/b/../c.txt == a/c.txt");
  const std::string canon_root = fs::weakly_canonical(root).string();
  expect(r.path.rfind(canon_root + "/", 0) == 0, "result is a descendant of root");
}

void test_resolve_rejects_escape() {
  const auto root = fresh_dir("sandbox_escape");
  const auto abs = cellar::resolve_path("/etc/passwd", root.string());
  expect(!abs.ok() && abs.error == cellar::ErrorCode::path_escape, "/etc/passwd is PathEscape");
  expect(abs.path.empty(), "no clamped path on escape");
  for (const char* bad : {"../x", "a/../../x", "..", "a/b/../../../etc", "./../sibling"}) {
    const auto r = cellar::resolve_path(bad, root.string());
    expect(!r.ok() && r.error == cellar::ErrorCode::path_escape, std::string("escape rejected: ") + bad);
  }
  const auto nul = cellar::resolve_path(std::string("a\0b", 3), root.string());
  expect(!nul.ok(), "embedded NUL rejected");
}

void test_resolve_property_over_candidates() {
  const auto root = fresh_dir("sandbox_prop");
  fs::create_directories(root / "d1" / "d2");
  const std::string canon_root = fs::weakly_canonical(root).string();
  const std::vector<std::string> candidates = {
      "", ".", "x", "d1/../x", "d1/d2/../../y", "d1/d2/../../../z", "//etc", "d1/./d2/f",
      "d1/../../" + root.filename().string() + "/ok", "a/../../../../../../../tmp", "..."};
  for (const auto& c : candidates) {
    const auto r = cellar::resolve_path(c, root.string());
    if (r.ok()) {
      expect(r.path == canon_root || r.path.rfind(canon_root + "/", 0) == 0, "ok result inside root: " + c);
    } else {
      expect(r.error == cellar::ErrorCode::path_escape, "failure is PathEscape: " + c);
    }
  }
}

void test_resolve_absolute_inside_root_and_symlink() {
  const auto root = fresh_dir("sandbox_abs");
  const auto outside = fresh_dir("sandbox_outside");
  const auto inside = cellar::resolve_path((root / "sub" / "f.txt").string(), root.string());
  expect(inside.ok(), "absolute path already inside root accepted");

  std::error_code ec;
  fs::create_directory_symlink(outside, root / "link", ec);
  expect(!ec, "symlink created");
  const auto via_link = cellar::resolve_path("link/secret.txt", root.string());
  expect(!via_link.ok() && via_link.error == cellar::ErrorCode::path_escape, "symlink escape rejected");
}

void test_sanitize_filename() {
  expect(cellar::sanitize_filename("../../etc/passwd") == "passwd", "directories dropped");
  expect(cellar::sanitize_filename("a\\b\\c.txt") == "c.txt", "backslash directories dropped");
  expect(cellar::sanitize_filename("...") == "unnamed", "dots only -> unnamed");
  expect(cellar::sanitize_filename("") == "unnamed", "empty -> unnamed");
  expect(cellar::sanitize_filename("re\x01port\n.csv") == "report.csv", "control chars removed");
  expect(cellar::sanitize_filename("a*b?c<d>.xlsx") == "abcd.xlsx", "shell metachars removed");
  expect(cellar::sanitize_filename(".hidden") == "hidden", "leading dot stripped");
  const std::string utf8 = "r\xc3\xa9sum\xc3\xa9.txt";
  expect(cellar::sanitize_filename(utf8) == utf8, "UTF-8 preserved");

  const std::string long_name = std::string(150, 'a') + ".xlsx";
  const std::string s = cellar::sanitize_filename(long_name);
  expect(s.size() == 100, "truncated to 100 bytes");
  expect(s.substr(s.size() - 5) == ".xlsx", "extension preserved on truncation");
}

// ============================================================================
// SessionIdentity
// ============================================================================

void test_derive_stable_within_bucket() {
  cellar::ClientSignature sig{"Mozilla/5.0 (X11; Linux x86_64)", "linux", ""};
  const uint64_t bucket_start = 480000ull * 3600ull * 1000ull;
  const auto a = cellar::derive_session_id(sig, bucket_start + 1000);
  const auto b = cellar::derive_session_id(sig, bucket_start + 1000);
  const auto c = cellar::derive_session_id(sig, bucket_start + 59 * 60 * 1000);
  expect(a == b, "same inputs same id");
  expect(a == c, "same bucket same id");
  expect(a.rfind("user_", 0) == 0 && a.size() == 5 + cellar::kSessionIdHexChars, "id format");
  expect(cellar::is_valid_session_id(a), "derived id is a valid session id");

  const auto next = cellar::derive_session_id(sig, bucket_start + 3600ull * 1000ull);
  expect(next != a, "next bucket drifts");

  cellar::ClientSignature other = sig;
  other.platform = "Win32";
  expect(cellar::derive_session_id(other, bucket_start) != a, "platform is part of the signature");
}

void test_derive_token_mode() {
  cellar::ClientSignature sig{"UA", "linux", "opaque-client-token-123"};
  const auto a = cellar::derive_session_id(sig, 1000);
  const auto b = cellar::derive_session_id(sig, 1000 + 72ull * 3600 * 1000);
  expect(a == b, "token ids ignore the time bucket");
  cellar::ClientSignature weak{"UA", "linux", ""};
  expect(cellar::derive_session_id(weak, 1000) != a, "token id differs from weak id");
}

void test_derive_or_accept() {
  cellar::ClientSignature sig{"UA", "linux", ""};
  expect(cellar::derive_or_accept(sig, "user_abc123", 0) == "user_abc123", "valid existing id kept");
  const auto replaced = cellar::derive_or_accept(sig, "../evil", 0);
  expect(replaced != "../evil" && cellar::is_valid_session_id(replaced), "malformed id replaced");
  expect(cellar::derive_or_accept(sig, "", 0) == cellar::derive_session_id(sig, 0), "empty -> derived");
}

// ============================================================================
// Configuration
// ============================================================================

void test_config_defaults_validate() {
  cellar::CellarConfig c;
  expect(c.base_dir == "user_uploads", "default base dir");
  expect(c.session_ttl == std::chrono::hours(24), "default ttl 24h");
  expect(c.max_files_per_session == 50, "default file limit");
  expect(c.max_upload_bytes == 200ull * 1024 * 1024, "default upload limit");
  expect(cellar::validate_config(c).ok, "defaults validate");
  expect(cellar::is_allowed_extension(c, "XLSX") && cellar::is_allowed_extension(c, ".csv"), "ext allow-list");
  expect(!cellar::is_allowed_extension(c, ".exe"), "exe not allowed");

  cellar::CellarConfig bad = c;
  bad.max_storage_per_session_bytes = bad.max_total_storage_bytes + 1;
  expect(!cellar::validate_config(bad).ok, "per-session > total is an error");

  cellar::CellarConfig zero = c;
  zero.session_ttl = std::chrono::milliseconds(0);
  expect(!cellar::validate_config(zero).ok, "zero ttl is an error");

  cellar::CellarConfig slow = c;
  slow.sweep_interval = std::chrono::hours(48);
  const auto v = cellar::validate_config(slow);
  expect(v.ok && !v.warnings.empty(), "sweep interval > ttl warns");
}

void test_config_file_and_env() {
  const auto dir = fresh_dir("config_file");
  const auto path = (dir / "cellar.json").string();
  write_all(path, R"({"base_dir":"/srv/cellar","session_ttl_hours":2,"max_upload_mb":10,)"
                  R"("allowed_upload_extensions":["CSV","xlsx"],"reaper_enabled":false})");
  cellar::CellarConfig c;
  expect(cellar::load_config_file(path, c).ok(), "config file loads");
  expect(c.base_dir == "/srv/cellar", "base dir from file");
  expect(c.session_ttl == std::chrono::hours(2), "ttl from file");
  expect(c.max_upload_bytes == 10ull * 1024 * 1024, "upload limit from file");
  expect(!c.reaper_enabled, "reaper flag from file");
  expect(cellar::is_allowed_extension(c, "csv") && !cellar::is_allowed_extension(c, "pdf"), "ext list replaced");

  write_all(path, R"({"session_ttl_hours":"two"})");
  cellar::CellarConfig d;
  expect(cellar::load_config_file(path, d).code == cellar::ErrorCode::config_invalid, "wrong type rejected");
  write_all(path, R"({"session_ttl_hours":)");
  expect(cellar::load_config_file(path, d).code == cellar::ErrorCode::json_parse_error, "bad json rejected");

  ::setenv("CELLAR_SESSION_TTL_HOURS", "3", 1);
  ::setenv("CELLAR_REAPER_DISABLED", "1", 1);
  cellar::CellarConfig e;
  expect(e.apply_env().ok(), "env applies");
  expect(e.session_ttl == std::chrono::hours(3) && !e.reaper_enabled, "env overrides");
  ::setenv("CELLAR_SESSION_TTL_HOURS", "-1", 1);
  expect(e.apply_env().code == cellar::ErrorCode::config_invalid, "negative env ttl rejected");
  ::unsetenv("CELLAR_SESSION_TTL_HOURS");
  ::unsetenv("CELLAR_REAPER_DISABLED");
}

void test_negative_numbers_rejected() {
  uint64_t v = 0;
  expect(cellar::parse_u64("42", v) && v == 42, "plain digits");
  for (const char* bad : {"-1", "+1", " 1", "", "1x", "99999999999999999999999"}) {
    expect(!cellar::parse_u64(bad, v), std::string("rejected: '") + bad + "'");
  }
  const auto dir = fresh_dir("config_negative");
  const auto path = (dir / "cellar.json").string();
  for (const char* body : {R"({"max_upload_mb":-5})", R"({"max_total_storage_gb":-0.5})",
                           R"({"session_ttl_hours":-1})", R"({"execution_timeout_seconds":-30})"}) {
    write_all(path, body);
    cellar::CellarConfig c;
    expect(cellar::load_config_file(path, c).code == cellar::ErrorCode::config_invalid,
           std::string("negative value rejected: ") + body);
  }
}

// ============================================================================
// ConfigRecord and redaction
// ============================================================================

void test_mask_secret() {
  const auto m = cellar::mask_secret("sk-1234567890abcdef");
  expect(m == "sk-1********cdef", "long secret keeps 4+4");
  expect(cellar::mask_secret("sk-1234567890abcdefghijklmnop").size() == 16, "preview has fixed length");
  expect(cellar::mask_secret("short") == "********", "short secret fully masked");
  expect(cellar::mask_secret("") == "", "empty stays empty");
}

void test_redact_never_leaks() {
  cellar::ConfigRecord rec;
  rec.api_key = "sk-SUPERSECRETVALUE-9999";
  rec.extra["base_url"] = "https://api.example.com";
  rec.extra["github_token"] = "ghp_abcdefghijklmnop";
  rec.extra["password"] = "hunter2hunter2";
  const auto view = cellar::redact(rec, cellar::CellarConfig{}.sensitive_keys);
  expect(view.has_api_key && view.api_key_preview == "sk-S********9999", "api key preview");
  expect(view.extra.at("base_url") == "https://api.example.com", "non-sensitive extra kept");
  expect(view.extra.at("github_token") != rec.extra.at("github_token"), "suffix rule masks *_token");
  expect(view.extra.at("password") != rec.extra.at("password"), "listed key masked");

  const std::string json = cellar::redacted_config_to_json(view, 1);
  expect(json.find("SUPERSECRET") == std::string::npos, "client json has no secret");
  expect(json.find("ghp_abcdefghijklmnop") == std::string::npos, "client json has no extra secret");
  expect(json.find("\"cache_type\":\"client_safe\"") != std::string::npos, "client marker present");
  expect(rec.api_key == "sk-SUPERSECRETVALUE-9999", "source record untouched");
}

void test_config_record_json_roundtrip() {
  cellar::ConfigRecord rec;
  rec.model = "deepseek-v3";
  rec.temperature = 0.25;
  rec.max_tokens = 1500;
  rec.api_key = "k";
  rec.extra["base_url"] = "http://localhost:8080";
  cellar::ConfigRecord back;
  expect(cellar::config_record_from_json(cellar::config_record_to_json(rec, 123), back).ok(), "parse back");
  expect(back == rec, "record survives serialization");
}

void test_config_record_precise_temperature() {
  const auto base = fresh_dir("cfg_precise");
  cellar::SessionService svc(test_config(base));
  expect(svc.open().ok(), "open");
  cellar::ConfigRecord rec;
  rec.model = "gpt-4o";
  for (double t : {0.1234567, 1.0 / 3.0, 0.7, 1.999999999}) {
    rec.temperature = t;
    expect(svc.save_config("user_precise", rec).ok(), "save config");
    cellar::ConfigRecord loaded;
    expect(svc.load_config("user_precise", loaded).ok(), "load config");
    expect(loaded == rec && loaded.temperature == t, "temperature survives save/load");
  }
}

// ============================================================================
// WorkspaceStore
// ============================================================================

void test_ensure_layout_idempotent() {
  const auto base = fresh_dir("store_layout");
  cellar::WorkspaceStore store(test_config(base));
  expect(store.init().ok(), "init");
  const auto first = store.ensure("user_a");
  expect(first.ok() && first.created, "first ensure creates");
  const auto& ws = first.workspace;
  for (const auto& p : {ws.uploads, ws.exports, ws.temp}) {
    expect(fs::is_directory(p), "sub-directory exists: " + p);
    expect(p.rfind(ws.root + "/", 0) == 0, "sub-directory under root");
  }
  expect(ws.root.rfind(store.base_dir() + "/", 0) == 0, "root under base");
  expect(fs::exists(ws.config_path), "default config written");
  const auto second = store.ensure("user_a");
  expect(second.ok() && !second.created, "second ensure does not create");
  expect(second.workspace == ws, "same workspace value");
}

void test_ensure_concurrent_single_scaffold() {
  const auto base = fresh_dir("store_concurrent");
  cellar::WorkspaceStore store(test_config(base));
  expect(store.init().ok(), "init");
  constexpr int kThreads = 16;
  std::vector<cellar::EnsureResult> results(kThreads);
  std::atomic<bool> go{false};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      while (!go.load()) std::this_thread::yield();
      results[i] = store.ensure("user_race");
    });
  }
  go = true;
  for (auto& t : threads) t.join();
  int created = 0;
  for (const auto& r : results) {
    expect(r.ok(), "concurrent ensure ok");
    expect(r.workspace == results[0].workspace, "equivalent workspace values");
    if (r.created) ++created;
  }
  expect(created == 1, "exactly one creator");
  expect(count_files(store.base_dir()) == 1, "exactly one scaffold on disk");
  expect(count_files(results[0].workspace.root) == 4, "uploads, exports, temp, config.json");
}

void test_ensure_rejects_bad_id() {
  const auto base = fresh_dir("store_badid");
  cellar::WorkspaceStore store(test_config(base));
  expect(store.init().ok(), "init");
  for (const char* bad : {"../x", "a/b", "", ".", "..", "user name"}) {
    const auto r = store.ensure(bad);
    expect(!r.ok() && r.status.code == cellar::ErrorCode::invalid_session_id, std::string("rejected: ") + bad);
  }
  expect(count_files(store.base_dir()) == 0, "nothing created");
  expect(store.purge("../x").code == cellar::ErrorCode::invalid_session_id, "purge rejects bad id");
}

void test_config_save_load_roundtrip() {
  const auto base = fresh_dir("store_config");
  cellar::WorkspaceStore store(test_config(base));
  expect(store.init().ok(), "init");
  cellar::ConfigRecord missing;
  expect(store.load_config("user_c", missing).code == cellar::ErrorCode::not_found, "missing -> not_found");

  cellar::ConfigRecord rec;
  rec.model = "gpt-4.1";
  rec.temperature = 0.5;
  rec.max_tokens = 2000;
  rec.api_key = "sk-abcdefghijklmnop";
  expect(store.save_config("user_c", rec).ok(), "save config");
  cellar::ConfigRecord loaded;
  expect(store.load_config("user_c", loaded).ok(), "load config");
  expect(loaded == rec, "saveConfig; loadConfig == cfg");

  expect(store.save_client_view("user_c", rec).ok(), "save client view");
  const auto view = read_all(store.layout("user_c").root + "/client_view.json");
  expect(view.find("sk-abcdefghijklmnop") == std::string::npos, "client view redacted");
  expect(view.find("sk-a********mnop") != std::string::npos, "client view has preview");
}

void test_list_exports_newest_first() {
  const auto base = fresh_dir("store_exports");
  cellar::WorkspaceStore store(test_config(base));
  expect(store.init().ok(), "init");
  const auto ws = make_workspace(store, "user_e");
  write_all(ws.exports + "/old.txt", "old");
  write_all(ws.exports + "/new.txt", "newer");
  fs::last_write_time(ws.exports + "/old.txt", fs::file_time_type::clock::now() - 1h);
  const auto list = store.list_exports("user_e");
  expect(list.size() == 2, "two exports");
  expect(list[0].name == "new.txt" && list[1].name == "old.txt", "sorted by mtime desc");
  expect(list[0].size == 5, "size reported");
  expect(list[0].mtime_unix_ms > list[1].mtime_unix_ms, "mtimes ordered");
}

void test_purge_idempotent_and_usage() {
  const auto base = fresh_dir("store_purge");
  cellar::WorkspaceStore store(test_config(base));
  expect(store.init().ok(), "init");
  const auto a = make_workspace(store, "user_p1");
  const auto b = make_workspace(store, "user_p2");
  write_all(a.exports + "/x.bin", std::string(1000, 'x'));
  write_all(b.exports + "/y.bin", std::string(500, 'y'));
  const auto usage = store.total_usage();
  expect(usage.session_count == 2, "two sessions counted");
  expect(usage.bytes_used >= 1500, "bytes aggregated");
  expect(store.session_usage("user_p1").bytes_used >= 1000, "per-session bytes");

  expect(store.purge("user_p1").ok(), "purge");
  expect(!store.exists("user_p1") && !fs::exists(a.root), "workspace removed");
  expect(store.purge("user_p1").ok(), "second purge is a no-op success");
  expect(store.purge("user_never").ok(), "purging unknown workspace succeeds");
  expect(store.total_usage().session_count == 1, "one session left");
}

void test_uploads_and_quotas() {
  const auto base = fresh_dir("store_uploads");
  auto cfg = test_config(base);
  cfg.max_files_per_session = 2;
  cfg.max_upload_bytes = 64;
  cellar::WorkspaceStore store(cfg);
  expect(store.init().ok(), "init");

  const auto r1 = store.save_upload("user_u", "../../data.csv", "a,b\n1,2\n");
  expect(r1.ok(), "csv upload accepted");
  expect(fs::path(r1.path).parent_path().string() == store.layout("user_u").uploads, "stored under uploads");
  expect(read_all(r1.path) == "a,b\n1,2\n", "bytes stored");
  expect(store.save_upload("user_u", "report.xlsx", "PK").ok(), "xlsx upload accepted");

  const auto r3 = store.save_upload("user_u", "third.txt", "x");
  expect(r3.status.code == cellar::ErrorCode::quota_exceeded, "file count quota");
  const auto big = store.save_upload("user_u2", "big.csv", std::string(65, 'z'));
  expect(big.status.code == cellar::ErrorCode::quota_exceeded, "size quota");
  const auto exe = store.save_upload("user_u2", "tool.exe", "MZ");
  expect(exe.status.code == cellar::ErrorCode::invalid_argument, "extension allow-list");

  const auto list = store.list_uploads("user_u");
  expect(list.size() == 2, "two uploads listed");
  std::set<std::string> names;
  for (const auto& e : list) names.insert(e.display_name);
  expect(names == std::set<std::string>{"data.csv", "report.xlsx"}, "display names strip prefix");
  const auto found = store.find_upload("user_u", "data.csv");
  expect(found && found->kind == cellar::FileKind::csv, "find by display name");
  expect(store.find_upload("user_u", found->name).has_value(), "find by stored name");
  expect(!store.find_upload("user_u", "nope.csv").has_value(), "missing upload");

  auto tight = test_config(fresh_dir("store_uploads_tight"));
  tight.max_storage_per_session_bytes = 16;
  cellar::WorkspaceStore small(tight);
  expect(small.init().ok(), "init tight");
  expect(small.save_upload("user_t", "a.csv", "1234").status.code == cellar::ErrorCode::quota_exceeded,
         "session storage quota");
}

void test_temp_path_and_prefix() {
  const auto base = fresh_dir("store_temp");
  cellar::WorkspaceStore store(test_config(base));
  expect(store.init().ok(), "init");
  expect(store.temp_path("user_t").error == cellar::ErrorCode::not_found, "no workspace -> not_found");
  const auto ws = make_workspace(store, "user_t");
  const auto gen = store.temp_path("user_t");
  expect(gen.ok(), "generated temp path");
  const auto leaf = fs::path(gen.path).filename().string();
  expect(leaf.rfind("temp_", 0) == 0 && leaf.size() == 17 && leaf.substr(13) == ".tmp", "temp_XXXXXXXX.tmp");
  expect(fs::path(gen.path).parent_path().string() == ws.temp, "under temp/");
  const auto named = store.temp_path("user_t", "../../x.tmp");
  expect(named.ok() && named.path == ws.temp + "/x.tmp", "named temp path sanitized");

  expect(cellar::strip_timestamp_prefix("20250101_120000_a.csv") == "a.csv", "upload prefix");
  expect(cellar::strip_timestamp_prefix("20250101120000_a.csv") == "a.csv", "export prefix");
  expect(cellar::strip_timestamp_prefix("a.csv") == "a.csv", "no prefix");
}

// ============================================================================
// FileInterceptor
// ============================================================================

void test_export_table_end_to_end() {
  const auto base = fresh_dir("icpt_e2e");
  cellar::WorkspaceStore store(test_config(base));
  expect(store.init().ok(), "init");
  const auto ws = make_workspace(store, "user_s");
  cellar::FileInterceptor interceptor({});
  auto session = interceptor.begin(ws);
  cellar::Table t{{"a", "b"}, {{"1", "2"}, {"x,y", "q\"t"}}};
  expect(session->export_table("result.xlsx", t).ok(), "export ok");
  const auto result = interceptor.end(*session);
  expect(result.produced_files.size() == 1, "exactly one produced file");
  const fs::path p(result.produced_files[0]);
  expect(p.parent_path().string() == ws.exports, "under exports");
  expect(is_export_name(p.filename().string(), "result.xlsx"), "{14-digit-ts}_result.xlsx");
  expect(read_all(p.string()) == "a,b\n1,2\n\"x,y\",\"q\"\"t\"\n", "expected bytes");
  expect(result.failures.empty() && !result.leak_detected, "clean result");
}

void test_traversal_and_absolute_redirected() {
  const auto base = fresh_dir("icpt_traversal");
  cellar::WorkspaceStore store(test_config(base));
  expect(store.init().ok(), "init");
  const auto ws = make_workspace(store, "user_s");
  cellar::InterceptionSession session(ws, {});
  expect(session.write_text("../../etc/passwd", "nope").ok(), "traversal save redirected");
  expect(session.write_text("/tmp/evil.json", "{}").ok(), "absolute save redirected");
  const auto r = session.end();
  expect(r.produced_files.size() == 2, "two files");
  expect(is_export_name(fs::path(r.produced_files[0]).filename().string(), "passwd"), "sanitized passwd");
  expect(is_export_name(fs::path(r.produced_files[1]).filename().string(), "evil.json"), "sanitized evil.json");
  for (const auto& f : r.produced_files) {
    expect(fs::path(f).parent_path().string() == ws.exports, "inside exports: " + f);
  }
  expect(!fs::exists("/tmp/evil.json") || read_all("/tmp/evil.json") != "{}", "absolute target untouched");
}

void test_name_collision_suffix() {
  const auto base = fresh_dir("icpt_collision");
  cellar::WorkspaceStore store(test_config(base));
  expect(store.init().ok(), "init");
  const auto ws = make_workspace(store, "user_s");
  cellar::InterceptorOptions opts;
  opts.clock = [] { return uint64_t{1700000000000}; };
  cellar::InterceptionSession session(ws, opts);
  expect(session.write_text("dup.txt", "one").ok(), "first");
  expect(session.write_text("dup.txt", "two").ok(), "second");
  const auto r = session.end();
  expect(r.produced_files.size() == 2 && r.produced_files[0] != r.produced_files[1], "distinct paths");
  const std::string second = fs::path(r.produced_files[1]).filename().string();
  expect(second.size() > 15 && second.substr(14) == "_dup_1.txt", "collision suffix");
  expect(read_all(r.produced_files[0]) == "one" && read_all(r.produced_files[1]) == "two", "no overwrite");
}

void test_open_for_write_and_dump_json() {
  const auto base = fresh_dir("icpt_open");
  cellar::WorkspaceStore store(test_config(base));
  expect(store.init().ok(), "init");
  const auto ws = make_workspace(store, "user_s");
  cellar::InterceptionSession session(ws, {});
  {
    auto o = session.open_for_write("notes.md");
    expect(o.ok() && o.stream, "open ok");
    *o.stream << "# hello\n";
  }
  cellar::jsonlite::Object obj;
  obj["rows"] = std::uint64_t{3};
  expect(session.dump_json("summary.json", obj).ok(), "dump ok");
  const auto r = session.end();
  expect(r.produced_files.size() == 2, "two produced files in call order");
  expect(read_all(r.produced_files[0]) == "# hello\n", "stream content");
  expect(read_all(r.produced_files[1]) == "{\"rows\":3}", "json content");
}

void test_failed_save_reported_and_others_continue() {
  const auto base = fresh_dir("icpt_fail");
  cellar::WorkspaceStore store(test_config(base));
  expect(store.init().ok(), "init");
  const auto ws = make_workspace(store, "user_s");
  cellar::InterceptorOptions opts;
  opts.table_writer = [](const std::string&, const cellar::Table&) {
    return cellar::Status::failure(cellar::ErrorCode::write_failed, "disk full");
  };
  const auto failed_before = cellar::global_service_stats().saves_failed.load();
  cellar::InterceptionSession session(ws, opts);
  const auto st = session.export_table("t.xlsx", cellar::Table{});
  expect(st.code == cellar::ErrorCode::write_failed, "writer failure surfaced");
  expect(session.write_text("after.txt", "ok").ok(), "later save still works");
  const auto r = session.end();
  expect(r.produced_files.size() == 1, "failed save absent from produced files");
  expect(r.failures.size() == 1 && r.failures[0].operation == "export_table", "failure recorded");
  expect(r.failures[0].message == "disk full", "failure message kept");
  expect(count_files(ws.exports) == 1, "partial file removed");
  expect(cellar::global_service_stats().saves_failed.load() == failed_before + 1, "failure counted");
}

void test_quota_blocks_interceptor_saves() {
  const auto base = fresh_dir("icpt_quota");
  cellar::WorkspaceStore store(test_config(base));
  expect(store.init().ok(), "init");
  const auto ws = make_workspace(store, "user_s");
  cellar::InterceptorOptions opts;
  opts.store = &store;
  opts.max_session_bytes = 10;  // config.json alone exceeds this
  cellar::InterceptionSession session(ws, opts);
  expect(session.write_text("x.txt", "x").code == cellar::ErrorCode::quota_exceeded, "quota enforced");
  const auto r = session.end();
  expect(r.produced_files.empty() && r.failures.size() == 1, "quota failure reported");
}

void test_quota_checked_after_table_export() {
  const auto base = fresh_dir("icpt_table_quota");
  cellar::WorkspaceStore store(test_config(base));
  expect(store.init().ok(), "init");
  const auto ws = make_workspace(store, "user_s");
  cellar::InterceptorOptions opts;
  opts.store = &store;
  opts.max_session_bytes = 4096;
  cellar::Table big{{"row", "value"}, {}};
  for (int i = 0; i < 2000; ++i) big.rows.push_back({std::to_string(i), "value_" + std::to_string(i)});

  cellar::InterceptionSession session(ws, opts);
  expect(session.export_table("big.csv", big).code == cellar::ErrorCode::quota_exceeded, "oversized table refused");
  expect(count_files(ws.exports) == 0, "oversized table removed");
  expect(session.write_text("small.txt", "ok").ok(), "small save still fits");
  const auto r = session.end();
  expect(r.produced_files.size() == 1, "only the small save produced");
  expect(r.failures.size() == 1 && r.failures[0].operation == "export_table" &&
             r.failures[0].error == cellar::ErrorCode::quota_exceeded,
         "table failure recorded");
  expect(store.session_usage("user_s").bytes_used <= 4096, "usage back under limit");
}

void test_quota_checked_for_streams_at_end() {
  const auto base = fresh_dir("icpt_stream_quota");
  cellar::WorkspaceStore store(test_config(base));
  expect(store.init().ok(), "init");
  const auto ws = make_workspace(store, "user_s");
  cellar::InterceptorOptions opts;
  opts.store = &store;
  opts.max_session_bytes = 4096;

  cellar::InterceptionSession session(ws, opts);
  std::string stream_path;
  {
    auto o = session.open_for_write("stream.log");
    expect(o.ok() && o.stream, "stream opened");
    stream_path = o.path;
    *o.stream << std::string(8192, 'x');
  }
  expect(fs::file_size(stream_path) == 8192, "stream flushed on close");
  const auto r = session.end();
  expect(r.produced_files.empty(), "oversized stream not produced");
  expect(r.failures.size() == 1 && r.failures[0].operation == "open_for_write" &&
             r.failures[0].error == cellar::ErrorCode::quota_exceeded,
         "stream failure recorded at end");
  expect(!fs::exists(stream_path) && count_files(ws.exports) == 0, "oversized stream removed");
}

void test_scoping_restores_ambient_behaviour() {
  const auto base = fresh_dir("icpt_scope");
  const auto plain = fresh_dir("icpt_scope_plain");
  cellar::WorkspaceStore store(test_config(base));
  expect(store.init().ok(), "init");
  const auto ws = make_workspace(store, "user_s");

  const std::string before = (plain / "before.txt").string();
  expect(cellar::fileops::write_text(before, "b").ok() && read_all(before) == "b", "verbatim before begin");

  cellar::InterceptionSession session(ws, {});
  {
    cellar::ScopedInterception bind(session);
    expect(cellar::fileops::intercepting(), "bound inside scope");
    expect(cellar::fileops::write_text((plain / "inside.txt").string(), "i").ok(), "ambient save");
    expect(!fs::exists(plain / "inside.txt"), "ambient save did not reach requested path");
  }
  const auto r = session.end();
  expect(r.produced_files.size() == 1, "ambient save produced");

  expect(!cellar::fileops::intercepting(), "unbound after scope");
  const std::string after = (plain / "after.txt").string();
  expect(cellar::fileops::write_text(after, "a").ok() && read_all(after) == "a", "verbatim after end");
  expect(count_files(ws.exports) == 1, "no residual redirection");
  expect(session.write_text("late.txt", "x").code == cellar::ErrorCode::invalid_argument, "ended session refuses");
}

void test_scope_released_on_exception_and_nesting() {
  const auto base = fresh_dir("icpt_unwind");
  cellar::WorkspaceStore store(test_config(base));
  expect(store.init().ok(), "init");
  const auto ws = make_workspace(store, "user_s");
  cellar::InterceptionSession a(ws, {});
  cellar::InterceptionSession b(ws, {});
  try {
    cellar::ScopedInterception bind(a);
    throw std::runtime_error("user code failed");
  } catch (const std::runtime_error&) {
  }
  expect(cellar::current_interception() == nullptr, "binding released during unwinding");
  {
    cellar::ScopedInterception outer(a);
    {
      cellar::ScopedInterception inner(b);
      expect(cellar::current_interception() == &b, "inner bound");
    }
    expect(cellar::current_interception() == &a, "outer restored");
  }
  expect(cellar::current_interception() == nullptr, "all released");
  a.end();
  b.end();
  expect(a.end().produced_files.empty(), "end is idempotent");
}

void test_leak_detected_and_logged() {
  const auto base = fresh_dir("icpt_leak");
  cellar::WorkspaceStore store(test_config(base));
  expect(store.init().ok(), "init");
  const auto ws = make_workspace(store, "user_s");
  const auto leaks_before = cellar::global_service_stats().interception_leaks.load();
  const auto fatal_before = count_logs(cellar::LogLevel::fatal, "interception leak");
  {
    cellar::InterceptionSession forgotten(ws, {});
    expect(forgotten.write_text("f.txt", "x").ok(), "save before leak");
  }
  expect(cellar::global_service_stats().interception_leaks.load() == leaks_before + 1, "leak counted");
  expect(count_logs(cellar::LogLevel::fatal, "interception leak") == fatal_before + 1, "leak logged at fatal");
}

void test_concurrent_sessions_isolated() {
  const auto base = fresh_dir("icpt_isolation");
  cellar::WorkspaceStore store(test_config(base));
  expect(store.init().ok(), "init");
  const auto ws1 = make_workspace(store, "user_s1");
  const auto ws2 = make_workspace(store, "user_s2");
  cellar::InterceptionResult r1, r2;
  std::atomic<bool> go{false};
  auto worker = [&go](const cellar::Workspace& ws, cellar::InterceptionResult& out) {
    cellar::InterceptionSession session(ws, {});
    {
      cellar::ScopedInterception bind(session);
      while (!go.load()) std::this_thread::yield();
      for (int i = 0; i < 20; ++i) {
        cellar::jsonlite::Object o;
        o["who"] = ws.session_id;
        expect(cellar::fileops::dump_json("out.json", o).ok(), "dump");
      }
    }
    out = session.end();
  };
  std::thread t1(worker, std::cref(ws1), std::ref(r1));
  std::thread t2(worker, std::cref(ws2), std::ref(r2));
  go = true;
  t1.join();
  t2.join();
  expect(r1.produced_files.size() == 20 && r2.produced_files.size() == 20, "all saves produced");
  for (const auto& f : r1.produced_files) {
    expect(fs::path(f).parent_path().string() == ws1.exports, "s1 file in s1 exports");
    expect(read_all(f) == "{\"who\":\"user_s1\"}", "s1 content");
  }
  for (const auto& f : r2.produced_files) {
    expect(fs::path(f).parent_path().string() == ws2.exports, "s2 file in s2 exports");
    expect(read_all(f) == "{\"who\":\"user_s2\"}", "s2 content");
  }
  expect(store.list_exports("user_s1").size() == 20 && store.list_exports("user_s2").size() == 20,
         "no cross-contamination in listings");
}

void test_audit_chain() {
  const auto base = fresh_dir("icpt_audit");
  const auto log_path = (base / "audit.ndjson").string();
  cellar::WorkspaceStore store(test_config(base / "ws"));
  expect(store.init().ok(), "init");
  const auto ws = make_workspace(store, "user_s");
  {
    cellar::FileAuditLog audit(log_path);
    cellar::InterceptorOptions opts;
    opts.audit = &audit;
    cellar::InterceptionSession session(ws, opts);
    expect(session.write_text("a.txt", "QQ").ok(), "a");
    expect(session.write_text("b.txt", "bbb").ok(), "b");
    expect(session.write_text("c.txt", "c").ok(), "c");
    session.end();
    expect(audit.entry_count() == 3 && audit.failure_count() == 0, "three entries");
  }
  auto check = cellar::verify_audit_chain(log_path);
  expect(check.ok && check.entries == 3, "chain verifies");
  expect(read_all(log_path).find("QQ") == std::string::npos, "contents not audited");

  {
    cellar::FileAuditLog reopened(log_path);
    cellar::FileAuditRecord rec;
    rec.session_id = "user_s";
    rec.operation = "write_text";
    rec.ok = true;
    expect(reopened.append(rec) && rec.sequence == 4, "reopened log continues the sequence");
  }
  expect(cellar::verify_audit_chain(log_path).entries == 4, "continued chain verifies");

  std::string text = read_all(log_path);
  const auto pos = text.find("\"bytes\":3");
  expect(pos != std::string::npos, "second entry present");
  text.replace(pos, 9, "\"bytes\":9");
  write_all(log_path, text);
  check = cellar::verify_audit_chain(log_path);
  expect(!check.ok && check.first_bad_sequence == 3, "tampering detected at next entry");
}

// ============================================================================
// Executor
// ============================================================================

void test_executor_normal_and_throw() {
  const auto base = fresh_dir("exec_basic");
  cellar::WorkspaceStore store(test_config(base));
  expect(store.init().ok(), "init");
  const auto ws = make_workspace(store, "user_x");
  cellar::FileInterceptor interceptor({});
  cellar::Executor exec(interceptor);

  cellar::Variables vars;
  vars["df"] = cellar::Table{{"n"}, {{"1"}, {"2"}}};
  const auto ok = exec.run(ws, [](cellar::ExecutionContext& ctx) {
    const auto& df = ctx.variables().at("df");
    expect(ctx.export_table("copy.csv", df).ok(), "export from context");
    expect(cellar::fileops::write_text("ambient.txt", "x").ok(), "ambient inside execution");
  }, 0ms, vars);
  expect(ok.ok && ok.error_code.empty(), "normal execution ok");
  expect(ok.produced_files.size() == 2, "both saves produced");
  expect(read_all(ok.produced_files[0]) == "n\n1\n2\n", "table bytes");

  const auto failed = exec.run(ws, [](cellar::ExecutionContext& ctx) {
    expect(ctx.write_text("partial.txt", "p").ok(), "save before throw");
    throw std::runtime_error("boom");
  }, 0ms);
  expect(!failed.ok && failed.error_code == "user_exception" && failed.error_message == "boom", "throw reported");
  expect(failed.produced_files.size() == 1, "saves before the throw kept");
  expect(!cellar::fileops::intercepting(), "no residual binding after throw");
}

void test_executor_timeout() {
  const auto base = fresh_dir("exec_timeout");
  cellar::WorkspaceStore store(test_config(base));
  expect(store.init().ok(), "init");
  const auto ws = make_workspace(store, "user_x");
  cellar::FileInterceptor interceptor({});
  cellar::Executor exec(interceptor);
  const auto cancelled_before = cellar::global_service_stats().executions_cancelled.load();
  const auto r = exec.run(ws, [](cellar::ExecutionContext& ctx) {
    expect(ctx.write_text("early.txt", "e").ok(), "save before deadline");
    for (int i = 0; i < 1000; ++i) {
      ctx.checkpoint();
      std::this_thread::sleep_for(5ms);
    }
  }, 30ms);
  expect(!r.ok && r.error_code == "cancelled", "deadline cancels");
  expect(r.produced_files.size() == 1, "pre-deadline save kept");
  expect(r.duration_ns < 3'000'000'000ull, "stopped early");
  expect(!cellar::fileops::intercepting(), "binding released after timeout");
  expect(cellar::global_service_stats().executions_cancelled.load() == cancelled_before + 1, "cancel counted");

  const std::string plain = (fresh_dir("exec_timeout_plain") / "p.txt").string();
  expect(cellar::fileops::write_text(plain, "v").ok() && read_all(plain) == "v", "verbatim after timeout");
}

void test_executor_cancel_source() {
  const auto base = fresh_dir("exec_cancel");
  cellar::WorkspaceStore store(test_config(base));
  expect(store.init().ok(), "init");
  const auto ws = make_workspace(store, "user_x");
  cellar::FileInterceptor interceptor({});
  cellar::Executor exec(interceptor);

  auto cancel = std::make_shared<cellar::CancellationSource>();
  std::thread canceller([cancel] {
    std::this_thread::sleep_for(20ms);
    cancel->cancel();
  });
  const auto r = exec.run(ws, [](cellar::ExecutionContext& ctx) {
    for (int i = 0; i < 2000; ++i) {
      std::this_thread::sleep_for(2ms);
      ctx.write_text("tick.txt", "t");
    }
  }, 0ms, {}, cancel);
  canceller.join();
  expect(!r.ok && r.error_code == "cancelled", "external cancel stops execution");
  expect(!r.produced_files.empty(), "ticks before cancel kept");

  auto pre = std::make_shared<cellar::CancellationSource>();
  pre->cancel();
  const auto r2 = exec.run(ws, [](cellar::ExecutionContext& ctx) { ctx.checkpoint(); }, 0ms, {}, pre);
  expect(!r2.ok && r2.error_code == "cancelled", "pre-cancelled source");
}

void test_context_copy_and_paths() {
  const auto base = fresh_dir("exec_copy");
  cellar::WorkspaceStore store(test_config(base));
  expect(store.init().ok(), "init");
  const auto ws = make_workspace(store, "user_x");
  const std::string outside = (fresh_dir("exec_copy_outside") / "secret.txt").string();
  write_all(outside, "s");
  cellar::FileInterceptor interceptor({});
  cellar::Executor exec(interceptor);

  std::string work;
  const auto r = exec.run(ws, [&outside, &work](cellar::ExecutionContext& ctx) {
    const auto tmp = ctx.temp_path("../../work.csv");
    expect(tmp.ok() && fs::path(tmp.path).filename() == "work.csv", "temp path sanitized");
    expect(tmp.path.rfind(ctx.workspace().temp, 0) == 0, "temp path inside temp dir");
    work = tmp.path;
    write_all(work, "a,b\n");
    expect(ctx.copy_to_exports(work, "final.csv").ok(), "copy with new name");
    expect(ctx.copy_to_exports(work).ok(), "copy keeps source name");
    expect(ctx.copy_to_exports(outside).code == cellar::ErrorCode::path_escape, "outside source refused");
    expect(ctx.copy_to_exports(ctx.workspace().temp + "/missing.csv").code == cellar::ErrorCode::not_found,
           "missing source");
    const auto chart = ctx.export_path("chart.png");
    expect(chart.ok() && chart.path.rfind(ctx.workspace().exports, 0) == 0, "export path reserved");
    write_all(chart.path, "PNG");
    expect(ctx.produced_files().size() == 3, "running list of produced files");
  }, 0ms);
  expect(r.ok, "execution ok");
  expect(r.produced_files.size() == 3, "copies and reserved path produced");
  expect(is_export_name(fs::path(r.produced_files[0]).filename().string(), "final.csv"), "renamed copy");
  expect(read_all(r.produced_files[0]) == "a,b\n", "copy bytes");
  expect(is_export_name(fs::path(r.produced_files[1]).filename().string(), "work.csv"), "source name copy");
  expect(is_export_name(fs::path(r.produced_files[2]).filename().string(), "chart.png"), "reserved name");
  expect(read_all(r.produced_files[2]) == "PNG", "reserved path written by caller");
  expect(r.failed_saves.size() == 2, "refused copies recorded");
  expect(fs::exists(work) && read_all(outside) == "s", "sources untouched");
}

// ============================================================================
// SessionRegistry / Reaper
// ============================================================================

void test_registry_touch_and_sweep() {
  const auto base = fresh_dir("reg_sweep");
  cellar::WorkspaceStore store(test_config(base));
  expect(store.init().ok(), "init");
  std::atomic<uint64_t> now{1'000'000};
  cellar::SessionRegistry reg(store, [&now] { return now.load(); });

  const auto a = reg.touch("user_a");
  expect(a.created_at_unix_ms == 1'000'000 && a.last_seen_unix_ms == 1'000'000, "record timestamps");
  make_workspace(store, "user_a");
  now = 1'001'000;
  reg.touch("user_b");
  make_workspace(store, "user_b");
  now = 1'002'000;
  const auto again = reg.touch("user_a");
  expect(again.created_at_unix_ms == 1'000'000 && again.last_seen_unix_ms == 1'002'000, "touch advances lastSeen");
  reg.touch("user_c");
  make_workspace(store, "user_c");

  now = 1'003'600;  // a: 1600 idle, b: 2600 idle, c: 1600 idle
  expect(reg.sweep(2000ms) == 1, "one session purged");
  expect(!store.exists("user_b") && !reg.find("user_b"), "expired workspace and record gone");
  expect(store.exists("user_a") && reg.find("user_a"), "touched session survives");
  expect(store.exists("user_c") && reg.find("user_c"), "fresh session survives");
  expect(reg.stats().active_sessions == 2, "stats after sweep");

  const auto reborn = reg.touch("user_b");
  expect(reborn.created_at_unix_ms == 1'003'600, "same id after expiry is a fresh session");
  expect(reg.sweep(2000ms) == 0, "nothing idle");
}

void test_registry_purge_and_adopt() {
  const auto base = fresh_dir("reg_purge");
  cellar::WorkspaceStore store(test_config(base));
  expect(store.init().ok(), "init");
  cellar::SessionRegistry reg(store, [] { return uint64_t{5000}; });
  expect(reg.adopt("user_old", 10, 20), "adopt inserts");
  expect(!reg.adopt("user_old", 30, 40), "adopt is a no-op when present");
  expect(!reg.adopt("../bad", 1, 1), "adopt validates id");
  expect(reg.find("user_old")->last_seen_unix_ms == 20, "adopted lastSeen");

  reg.touch("user_p");
  make_workspace(store, "user_p");
  expect(reg.purge("user_p").ok(), "explicit purge");
  expect(!store.exists("user_p") && !reg.find("user_p"), "purged");
  expect(reg.purge("user_p").ok(), "purge idempotent");
  expect(reg.size() == 1, "only adopted record left");
}

void test_registry_concurrent_touch_and_sweep() {
  const auto base = fresh_dir("reg_stress");
  auto cfg = test_config(base);
  cellar::SessionService svc(cfg);
  expect(svc.open().ok(), "open");
  std::atomic<bool> stop{false};
  std::vector<std::thread> touchers;
  for (int t = 0; t < 4; ++t) {
    touchers.emplace_back([&svc, &stop, t] {
      int i = 0;
      while (!stop.load()) {
        const std::string id = "user_t" + std::to_string(t) + "_" + std::to_string(i++ % 8);
        const auto r = svc.ensure_workspace(id);
        expect(r.ok(), "ensure under sweep pressure: " + r.status.message);
      }
    });
  }
  std::thread sweeper([&svc, &stop] {
    while (!stop.load()) {
      svc.sweep_now(0ms);
      std::this_thread::sleep_for(1ms);
    }
  });
  std::this_thread::sleep_for(200ms);
  stop = true;
  for (auto& t : touchers) t.join();
  sweeper.join();
  std::this_thread::sleep_for(5ms);
  svc.sweep_now(0ms);
  expect(svc.registry().size() == 0, "final sweep empties the registry");
}

void test_reaper_thread_expires_sessions() {
  const auto base = fresh_dir("reaper");
  cellar::WorkspaceStore store(test_config(base));
  expect(store.init().ok(), "init");
  cellar::SessionRegistry reg(store);
  reg.touch("user_r");
  make_workspace(store, "user_r");
  cellar::Reaper reaper(reg, 10ms, 1ms);
  reaper.start();
  expect(reaper.running(), "reaper running");
  for (int i = 0; i < 300 && store.exists("user_r"); ++i) std::this_thread::sleep_for(10ms);
  expect(!store.exists("user_r"), "reaper purged idle workspace");
  reaper.stop();
  expect(!reaper.running() && reaper.cycles() >= 1 && reaper.purged_total() == 1, "reaper stopped cleanly");
}

// ============================================================================
// SessionService
// ============================================================================

void test_service_startup_adoption_and_sweep() {
  const auto base = fresh_dir("svc_adopt");
  fs::create_directories(base / "user_old" / "exports");
  write_all((base / "user_old" / "exports" / "f.csv").string(), "x");
  const auto old_time = fs::file_time_type::clock::now() - 48h;
  fs::last_write_time(base / "user_old" / "exports" / "f.csv", old_time);
  fs::last_write_time(base / "user_old" / "exports", old_time);
  fs::last_write_time(base / "user_old", old_time);
  fs::create_directories(base / "user_new" / "exports");
  fs::create_directories(base / "not.a.session");

  auto cfg = test_config(base);
  cfg.sweep_on_startup = true;
  cellar::SessionService svc(cfg);
  expect(svc.start().ok(), "start");
  expect(!fs::exists(base / "user_old"), "stale workspace swept on startup");
  expect(fs::exists(base / "user_new") && svc.registry().find("user_new"), "fresh workspace adopted");
  expect(fs::exists(base / "not.a.session"), "foreign directories ignored");
  expect(!svc.reaper_running(), "reaper disabled by config");
}

void test_saved_config_workspace_is_reaped() {
  const auto base = fresh_dir("svc_config_reap");
  std::atomic<uint64_t> now{1'000'000'000};
  cellar::SessionService svc(test_config(base), [&now] { return now.load(); });
  expect(svc.open().ok(), "open");
  cellar::ConfigRecord rec;
  rec.api_key = "sk-only-config";
  expect(svc.save_config("user_cfgonly", rec).ok(), "save config for fresh session");
  expect(svc.store().exists("user_cfgonly") && svc.registry().find("user_cfgonly"), "workspace registered");
  expect(svc.stats().active_sessions == 1, "counted once");
  now += 48ull * 3600 * 1000;
  expect(svc.sweep_now(24h) == 1, "idle config-only session swept");
  expect(!svc.store().exists("user_cfgonly") && !fs::exists(base / "user_cfgonly"), "workspace reclaimed");
}

void test_service_request_path() {
  const auto base = fresh_dir("svc_request");
  cellar::SessionService svc(test_config(base));
  expect(svc.open().ok(), "open");
  const auto id = svc.derive_or_accept({"Mozilla/5.0", "linux", ""});
  const auto ens = svc.ensure_workspace(id);
  expect(ens.ok() && svc.registry().find(id), "ensure registers session");

  cellar::ConfigRecord loaded;
  expect(svc.load_config("user_fresh", loaded).ok() && loaded == cellar::ConfigRecord{}, "missing config -> defaults");
  cellar::ConfigRecord rec;
  rec.api_key = "sk-service-secret-0000";
  expect(svc.save_config(id, rec).ok(), "save config");
  const auto view = read_all(ens.workspace.root + "/client_view.json");
  expect(view.find("sk-service-secret-0000") == std::string::npos && view.find("client_safe") != std::string::npos,
         "client view written alongside config");

  const auto r = svc.execute(id, [](cellar::ExecutionContext& ctx) {
    expect(ctx.export_table("result.xlsx", cellar::Table{{"k"}, {{"v"}}}).ok(), "export");
  });
  expect(r.ok && r.produced_files.size() == 1, "execute produced one file");
  const auto exports = svc.list_exports(id);
  expect(exports.size() == 1 && exports[0].path == r.produced_files[0], "listing matches produced file");

  auto foreign = ens.workspace;
  foreign.exports = base.string();
  auto session = svc.begin_interception(foreign);
  expect(!session->write_text("x.txt", "x").ok(), "foreign workspace refused");
  svc.end_interception(*session);

  const auto json = svc.stats_json();
  expect(json.find("\"active_sessions\":1") != std::string::npos, "stats json has registry");
  expect(json.find("\"saves_redirected\"") != std::string::npos, "stats json has service counters");

  expect(svc.purge_session(id).ok() && !svc.store().exists(id), "purge session");
  expect(svc.ensure_workspace("../evil").status.code == cellar::ErrorCode::invalid_session_id, "bad id refused");
}

void test_service_concurrent_exports_isolated() {
  const auto base = fresh_dir("svc_isolation");
  cellar::SessionService svc(test_config(base));
  expect(svc.open().ok(), "open");
  cellar::ExecutionResult r1, r2;
  auto run = [&svc](const std::string& id, cellar::ExecutionResult& out) {
    out = svc.execute(id, [&id](cellar::ExecutionContext& ctx) {
      cellar::jsonlite::Object o;
      o["owner"] = id;
      expect(ctx.dump_json("out.json", o).ok(), "dump");
    });
  };
  std::thread t1(run, "user_one", std::ref(r1));
  std::thread t2(run, "user_two", std::ref(r2));
  t1.join();
  t2.join();
  expect(r1.ok && r2.ok, "both ok");
  expect(r1.produced_files.size() == 1 && r2.produced_files.size() == 1, "one file each");
  expect(fs::path(r1.produced_files[0]).parent_path().string() == svc.store().layout("user_one").exports,
         "S1 path under S1 exports");
  expect(fs::path(r2.produced_files[0]).parent_path().string() == svc.store().layout("user_two").exports,
         "S2 path under S2 exports");
  expect(svc.list_exports("user_one").size() == 1 && svc.list_exports("user_two").size() == 1, "no cross listing");
  expect(read_all(r1.produced_files[0]) == "{\"owner\":\"user_one\"}", "S1 content");
}

void test_service_reaper_lifecycle() {
  const auto base = fresh_dir("svc_reaper");
  auto cfg = test_config(base);
  cfg.reaper_enabled = true;
  cfg.session_ttl = 20ms;
  cfg.sweep_interval = 10ms;
  cellar::SessionService svc(cfg);
  expect(svc.start().ok(), "start");
  expect(svc.reaper_running(), "reaper started");
  expect(svc.ensure_workspace("user_gone").ok(), "ensure");
  for (int i = 0; i < 300 && svc.store().exists("user_gone"); ++i) std::this_thread::sleep_for(10ms);
  expect(!svc.store().exists("user_gone"), "service reaper expires idle sessions");
  svc.stop();
  expect(!svc.reaper_running(), "reaper stopped");
}

void test_version_manifest() {
  const auto m = cellar::version::current_manifest();
  expect(m.semver == cellar::version::CELLAR_SEMVER, "semver");
  expect(m.hash_primitive == "blake3", "hash primitive");
  const auto json = cellar::version::manifest_to_json(m);
  expect(json.find("\"workspace_layout\":1") != std::string::npos, "layout version in manifest");
}

}  // namespace

int main() {
  cellar::set_log_hook(capture_log);
  std::cout << "=== cellar tests ===\n";

  std::cout << "\n[Hashing, JSON, logging]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("hash domain separation", test_hash_domain_separation);
  run_test("json sorted roundtrip", test_json_sorted_roundtrip);
  run_test("json strictness", test_json_rejects_duplicates_and_nan);
  run_test("json unicode escapes", test_json_unicode_escapes);
  run_test("json double precision", test_json_double_precision);
  run_test("log record json", test_log_record_json);
  run_test("latency histogram", test_latency_histogram);

  std::cout << "\n[PathSandbox]\n";
  run_test("resolve descendant", test_resolve_descendant);
  run_test("resolve rejects escape", test_resolve_rejects_escape);
  run_test("resolve property over candidates", test_resolve_property_over_candidates);
  run_test("absolute inside root, symlink escape", test_resolve_absolute_inside_root_and_symlink);
  run_test("sanitize filename", test_sanitize_filename);

  std::cout << "\n[SessionIdentity]\n";
  run_test("derive stable within bucket", test_derive_stable_within_bucket);
  run_test("derive token mode", test_derive_token_mode);
  run_test("derive or accept", test_derive_or_accept);

  std::cout << "\n[Configuration]\n";
  run_test("defaults and validation", test_config_defaults_validate);
  run_test("config file and env", test_config_file_and_env);
  run_test("negative numbers rejected", test_negative_numbers_rejected);

  std::cout << "\n[ConfigRecord]\n";
  run_test("mask secret", test_mask_secret);
  run_test("redaction never leaks", test_redact_never_leaks);
  run_test("record json roundtrip", test_config_record_json_roundtrip);
  run_test("precise temperature", test_config_record_precise_temperature);

  std::cout << "\n[WorkspaceStore]\n";
  run_test("ensure layout idempotent", test_ensure_layout_idempotent);
  run_test("concurrent ensure single scaffold", test_ensure_concurrent_single_scaffold);
  run_test("ensure rejects bad id", test_ensure_rejects_bad_id);
  run_test("config save/load roundtrip", test_config_save_load_roundtrip);
  run_test("list exports newest first", test_list_exports_newest_first);
  run_test("purge idempotent + usage", test_purge_idempotent_and_usage);
  run_test("uploads and quotas", test_uploads_and_quotas);
  run_test("temp path + prefixes", test_temp_path_and_prefix);

  std::cout << "\n[FileInterceptor]\n";
  run_test("export table end to end", test_export_table_end_to_end);
  run_test("traversal and absolute redirected", test_traversal_and_absolute_redirected);
  run_test("name collision suffix", test_name_collision_suffix);
  run_test("open for write + dump json", test_open_for_write_and_dump_json);
  run_test("failed save reported", test_failed_save_reported_and_others_continue);
  run_test("quota blocks saves", test_quota_blocks_interceptor_saves);
  run_test("quota after table export", test_quota_checked_after_table_export);
  run_test("stream quota at end", test_quota_checked_for_streams_at_end);
  run_test("scoping restores ambient behaviour", test_scoping_restores_ambient_behaviour);
  run_test("scope released on exception + nesting", test_scope_released_on_exception_and_nesting);
  run_test("leak detected and logged", test_leak_detected_and_logged);
  run_test("concurrent sessions isolated", test_concurrent_sessions_isolated);
  run_test("audit chain", test_audit_chain);

  std::cout << "\n[Executor]\n";
  run_test("normal + throwing code", test_executor_normal_and_throw);
  run_test("timeout", test_executor_timeout);
  run_test("cancellation source", test_executor_cancel_source);
  run_test("context copy and paths", test_context_copy_and_paths);

  std::cout << "\n[SessionRegistry / Reaper]\n";
  run_test("touch and sweep", test_registry_touch_and_sweep);
  run_test("purge and adopt", test_registry_purge_and_adopt);
  run_test("concurrent touch and sweep", test_registry_concurrent_touch_and_sweep);
  run_test("reaper thread expires sessions", test_reaper_thread_expires_sessions);

  std::cout << "\n[SessionService]\n";
  run_test("startup adoption and sweep", test_service_startup_adoption_and_sweep);
  run_test("request path", test_service_request_path);
  run_test("saved config reaped", test_saved_config_workspace_is_reaped);
  run_test("concurrent exports isolated", test_service_concurrent_exports_isolated);
  run_test("reaper lifecycle", test_service_reaper_lifecycle);
  run_test("version manifest", test_version_manifest);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
