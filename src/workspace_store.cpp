#include "cellar/workspace_store.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

#include "cellar/log.hpp"
#include "cellar/observability.hpp"

namespace fs = std::filesystem;

namespace cellar {

namespace {

constexpr const char* kComponent = "workspace";
constexpr const char* kConfigFile = "config.json";
constexpr const char* kClientViewFile = "client_view.json";
constexpr int kMaxReserveAttempts = 10000;
constexpr std::size_t kLockTablePruneThreshold = 1024;

std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  return (dir / (".tmp_" + std::to_string(dist(rng)))).string();
}

std::string random_hex(std::size_t n) {
  static thread_local std::mt19937 rng(std::random_device{}());
  std::uniform_int_distribution<int> dist(0, 15);
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out(n, '0');
  for (auto& c : out) c = kHex[dist(rng)];
  return out;
}

std::string format_local(uint64_t unix_ms, const char* fmt) {
  const std::time_t t = static_cast<std::time_t>(unix_ms / 1000);
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[32];
  const std::size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
  return std::string(buf, n);
}

int64_t to_unix_ms(fs::file_time_type ft) {
  using namespace std::chrono;
  const auto sys = time_point_cast<milliseconds>(ft - fs::file_time_type::clock::now() + system_clock::now());
  return static_cast<int64_t>(sys.time_since_epoch().count());
}

SessionUsage dir_usage(const fs::path& root) {
  SessionUsage u;
  std::error_code ec;
  if (!fs::exists(root, ec)) return u;
  for (fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec), end;
       !ec && it != end; it.increment(ec)) {
    std::error_code fec;
    if (it->is_regular_file(fec)) {
      const auto sz = it->file_size(fec);
      if (!fec) {
        u.bytes_used += sz;
        ++u.file_count;
      }
    }
  }
  return u;
}

uint64_t newest_mtime(const fs::path& root) {
  std::error_code ec;
  int64_t newest = 0;
  const auto root_time = fs::last_write_time(root, ec);
  if (!ec) newest = to_unix_ms(root_time);
  for (fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec), end;
       !ec && it != end; it.increment(ec)) {
    std::error_code tec;
    const auto t = it->last_write_time(tec);
    if (!tec) newest = std::max(newest, to_unix_ms(t));
  }
  return newest > 0 ? static_cast<uint64_t>(newest) : 0;
}

bool is_digits(const std::string& s, std::size_t pos, std::size_t n) {
  if (s.size() < pos + n) return false;
  for (std::size_t i = pos; i < pos + n; ++i) {
    if (s[i] < '0' || s[i] > '9') return false;
  }
  return true;
}

// Creates dir, treating "already a directory" as success so that a racing
// creator is coalesced rather than reported.
Status make_dir(const fs::path& dir) {
  for (int attempt = 0; attempt < 3; ++attempt) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (!ec) return Status::success();
    std::error_code sec;
    if (fs::is_directory(dir, sec)) return Status::success();
    if (fs::exists(dir, sec)) {
      return Status::failure(ErrorCode::workspace_create_conflict,
                             dir.string() + " exists and is not a directory");
    }
  }
  return Status::failure(ErrorCode::write_failed, "cannot create " + dir.string());
}

Status read_file(const std::string& path, std::string& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return Status::failure(ErrorCode::not_found, path + " not found");
  std::stringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return Status::success();
}

}  // namespace

// ---------------------------------------------------------------------------
// Free helpers
// ---------------------------------------------------------------------------

uint64_t now_unix_ms() {
  using namespace std::chrono;
  return static_cast<uint64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

std::string upload_timestamp(uint64_t unix_ms) { return format_local(unix_ms, "%Y%m%d_%H%M%S"); }
std::string export_timestamp(uint64_t unix_ms) { return format_local(unix_ms, "%Y%m%d%H%M%S"); }

std::string strip_timestamp_prefix(const std::string& stored_name) {
  // YYYYMMDD_HHMMSS_name
  if (is_digits(stored_name, 0, 8) && stored_name.size() > 16 && stored_name[8] == '_' &&
      is_digits(stored_name, 9, 6) && stored_name[15] == '_') {
    return stored_name.substr(16);
  }
  // YYYYMMDDHHMMSS_name
  if (is_digits(stored_name, 0, 14) && stored_name.size() > 15 && stored_name[14] == '_') {
    return stored_name.substr(15);
  }
  return stored_name;
}

ReservedPath reserve_unique_path(const std::string& dir, const std::string& prefix,
                                 const std::string& sanitized_name) {
  ReservedPath out;
  const std::string ext = file_extension(sanitized_name);
  const std::string stem = sanitized_name.substr(0, sanitized_name.size() - ext.size());

  for (int n = 0; n < kMaxReserveAttempts; ++n) {
    const std::string candidate = n == 0 ? prefix + "_" + sanitized_name
                                         : prefix + "_" + stem + "_" + std::to_string(n) + ext;
    const PathResolution r = resolve_path(candidate, dir);
    if (!r.ok()) {
      out.status = Status::failure(r.error, r.detail);
      return out;
    }
    const int fd = ::open(r.path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd >= 0) {
      ::close(fd);
      out.path = r.path;
      return out;
    }
    if (errno != EEXIST) {
      out.status = Status::failure(ErrorCode::write_failed, r.path + ": " + std::strerror(errno));
      return out;
    }
  }
  out.status = Status::failure(ErrorCode::write_failed, "no free name for " + sanitized_name);
  return out;
}

bool atomic_write(const std::string& target, const std::string& data) {
  const fs::path t(target);
  const std::string tmp = make_tmp_name(t.parent_path());
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!ofs) {
      std::remove(tmp.c_str());
      return false;
    }
  }
  std::error_code ec;
  fs::rename(tmp, t, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

// ---------------------------------------------------------------------------
// WorkspaceStore
// ---------------------------------------------------------------------------

WorkspaceStore::WorkspaceStore(CellarConfig cfg) : cfg_(std::move(cfg)) {}

Status WorkspaceStore::init() {
  const Status st = make_dir(cfg_.base_dir);
  if (!st.ok()) return st;
  std::error_code ec;
  const fs::path canon = fs::canonical(fs::absolute(cfg_.base_dir, ec), ec);
  if (ec) return Status::failure(ErrorCode::write_failed, "cannot resolve base dir: " + ec.message());
  base_ = canon.string();
  return Status::success();
}

std::shared_ptr<std::mutex> WorkspaceStore::lock_for(const SessionId& id) {
  std::lock_guard<std::mutex> lk(table_mu_);
  if (locks_.size() > kLockTablePruneThreshold) {
    for (auto it = locks_.begin(); it != locks_.end();) {
      it = it->second.expired() ? locks_.erase(it) : std::next(it);
    }
  }
  auto& slot = locks_[id];
  auto m = slot.lock();
  if (!m) {
    m = std::make_shared<std::mutex>();
    slot = m;
  }
  return m;
}

Workspace WorkspaceStore::layout(const SessionId& id) const {
  Workspace ws;
  if (!is_valid_session_id(id) || base_.empty()) return ws;
  const PathResolution r = resolve_path(id, base_);
  if (!r.ok() || r.path == base_) return ws;
  ws.session_id = id;
  ws.root = r.path;
  ws.uploads = r.path + "/uploads";
  ws.exports = r.path + "/exports";
  ws.temp = r.path + "/temp";
  ws.config_path = r.path + "/" + kConfigFile;
  return ws;
}

bool WorkspaceStore::exists(const SessionId& id) const {
  const Workspace ws = layout(id);
  std::error_code ec;
  return ws.valid() && fs::is_directory(ws.root, ec);
}

EnsureResult WorkspaceStore::ensure(const SessionId& id) {
  EnsureResult out;
  if (!is_valid_session_id(id)) {
    out.status = Status::failure(ErrorCode::invalid_session_id, "malformed session id");
    return out;
  }
  const Workspace ws = layout(id);
  if (!ws.valid()) {
    out.status = Status::failure(ErrorCode::path_escape, "workspace for " + id + " resolves outside base");
    return out;
  }

  auto mu = lock_for(id);
  std::lock_guard<std::mutex> lk(*mu);

  std::error_code ec;
  out.created = fs::create_directory(ws.root, ec);
  if (ec) {
    const Status st = make_dir(ws.root);
    if (!st.ok()) {
      out.status = st.code == ErrorCode::workspace_create_conflict
                       ? Status::failure(ErrorCode::write_failed, st.message)
                       : st;
      return out;
    }
  }
  for (const auto* sub : {&ws.uploads, &ws.exports, &ws.temp}) {
    const Status st = make_dir(*sub);
    if (!st.ok()) {
      out.status = Status::failure(ErrorCode::write_failed, st.message);
      return out;
    }
    // A planted symlink would canonicalize elsewhere.
    if (!is_within(*sub, ws.root)) {
      out.status = Status::failure(ErrorCode::path_escape, *sub + " escapes workspace root");
      return out;
    }
  }
  if (!fs::exists(ws.config_path, ec)) {
    if (!atomic_write(ws.config_path, config_record_to_json(ConfigRecord{}, now_unix_ms()))) {
      out.status = Status::failure(ErrorCode::write_failed, "cannot write " + ws.config_path);
      return out;
    }
  }

  if (out.created) {
    log_event(LogLevel::info, kComponent, "workspace created", {{"session_id", id}});
  }
  out.workspace = ws;
  return out;
}

Status WorkspaceStore::load_config(const SessionId& id, ConfigRecord& out) const {
  const Workspace ws = layout(id);
  if (!ws.valid()) return Status::failure(ErrorCode::invalid_session_id, "malformed session id");
  std::string text;
  const Status st = read_file(ws.config_path, text);
  if (!st.ok()) return st;
  return config_record_from_json(text, out);
}

Status WorkspaceStore::save_config(const SessionId& id, const ConfigRecord& cfg) {
  const EnsureResult ens = ensure(id);
  if (!ens.ok()) return ens.status;
  auto mu = lock_for(id);
  std::lock_guard<std::mutex> lk(*mu);
  if (!atomic_write(ens.workspace.config_path, config_record_to_json(cfg, now_unix_ms()))) {
    log_event(LogLevel::error, kComponent, "config save failed", {{"session_id", id}});
    return Status::failure(ErrorCode::write_failed, "cannot write " + ens.workspace.config_path);
  }
  return Status::success();
}

Status WorkspaceStore::save_client_view(const SessionId& id, const ConfigRecord& cfg) {
  const EnsureResult ens = ensure(id);
  if (!ens.ok()) return ens.status;
  const std::string path = ens.workspace.root + "/" + kClientViewFile;
  const std::string body = redacted_config_to_json(redact(cfg, cfg_.sensitive_keys), now_unix_ms());
  auto mu = lock_for(id);
  std::lock_guard<std::mutex> lk(*mu);
  if (!atomic_write(path, body)) {
    return Status::failure(ErrorCode::write_failed, "cannot write " + path);
  }
  return Status::success();
}

std::vector<ExportEntry> WorkspaceStore::list_exports(const SessionId& id) const {
  std::vector<ExportEntry> out;
  const Workspace ws = layout(id);
  if (!ws.valid()) return out;
  std::error_code ec;
  for (fs::directory_iterator it(ws.exports, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code fec;
    if (!it->is_regular_file(fec)) continue;
    const std::string name = it->path().filename().string();
    if (name.empty() || name[0] == '.') continue;
    ExportEntry e;
    e.name = name;
    e.path = it->path().string();
    e.size = it->file_size(fec);
    e.mtime_unix_ms = to_unix_ms(it->last_write_time(fec));
    out.push_back(std::move(e));
  }
  std::sort(out.begin(), out.end(), [](const ExportEntry& a, const ExportEntry& b) {
    if (a.mtime_unix_ms != b.mtime_unix_ms) return a.mtime_unix_ms > b.mtime_unix_ms;
    return a.name > b.name;
  });
  return out;
}

Status WorkspaceStore::purge(const SessionId& id) {
  if (!is_valid_session_id(id)) {
    return Status::failure(ErrorCode::invalid_session_id, "malformed session id");
  }
  const Workspace ws = layout(id);
  if (!ws.valid()) {
    return Status::failure(ErrorCode::path_escape, "workspace for " + id + " resolves outside base");
  }
  auto mu = lock_for(id);
  std::lock_guard<std::mutex> lk(*mu);
  std::error_code ec;
  if (!fs::exists(ws.root, ec)) return Status::success();
  fs::remove_all(ws.root, ec);
  if (ec) {
    log_event(LogLevel::error, kComponent, "purge failed", {{"session_id", id}, {"error", ec.message()}});
    return Status::failure(ErrorCode::write_failed, "cannot remove " + ws.root + ": " + ec.message());
  }
  log_event(LogLevel::info, kComponent, "workspace purged", {{"session_id", id}});
  return Status::success();
}

StoreUsage WorkspaceStore::total_usage() const {
  StoreUsage u;
  for (const auto& [id, mtime] : scan()) {
    (void)mtime;
    ++u.session_count;
    u.bytes_used += dir_usage(layout(id).root).bytes_used;
  }
  return u;
}

SessionUsage WorkspaceStore::session_usage(const SessionId& id) const {
  const Workspace ws = layout(id);
  if (!ws.valid()) return {};
  return dir_usage(ws.root);
}

UploadResult WorkspaceStore::save_upload(const SessionId& id, const std::string& original_name,
                                         const std::string& bytes) {
  UploadResult out;
  auto& stats = global_service_stats();
  auto reject = [&](ErrorCode code, std::string msg) {
    stats.uploads_rejected.fetch_add(1, std::memory_order_relaxed);
    log_event(LogLevel::warn, kComponent, "upload rejected",
              {{"session_id", id}, {"error", to_string(code)}, {"detail", msg}});
    out.status = Status::failure(code, std::move(msg));
    return out;
  };

  const std::string name = sanitize_filename(original_name);
  if (bytes.size() > cfg_.max_upload_bytes) {
    return reject(ErrorCode::quota_exceeded, "upload exceeds " + std::to_string(cfg_.max_upload_bytes) + " bytes");
  }
  if (!is_allowed_extension(cfg_, file_extension(name))) {
    return reject(ErrorCode::invalid_argument, "extension not allowed: " + name);
  }

  const EnsureResult ens = ensure(id);
  if (!ens.ok()) return reject(ens.status.code, ens.status.message);

  auto mu = lock_for(id);
  std::lock_guard<std::mutex> lk(*mu);

  if (dir_usage(ens.workspace.uploads).file_count >= cfg_.max_files_per_session) {
    return reject(ErrorCode::quota_exceeded, "upload count limit reached");
  }
  if (dir_usage(ens.workspace.root).bytes_used + bytes.size() > cfg_.max_storage_per_session_bytes) {
    return reject(ErrorCode::quota_exceeded, "session storage limit reached");
  }

  const ReservedPath reserved = reserve_unique_path(ens.workspace.uploads, upload_timestamp(now_unix_ms()), name);
  if (!reserved.ok()) return reject(reserved.status.code, reserved.status.message);

  std::ofstream ofs(reserved.path, std::ios::binary | std::ios::trunc);
  ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  ofs.close();
  if (!ofs) {
    std::remove(reserved.path.c_str());
    return reject(ErrorCode::write_failed, "cannot write " + reserved.path);
  }

  stats.uploads_accepted.fetch_add(1, std::memory_order_relaxed);
  log_event(LogLevel::info, kComponent, "upload stored",
            {{"session_id", id}, {"name", fs::path(reserved.path).filename().string()},
             {"bytes", std::to_string(bytes.size())}});
  out.path = reserved.path;
  return out;
}

std::vector<UploadEntry> WorkspaceStore::list_uploads(const SessionId& id) const {
  std::vector<UploadEntry> out;
  const Workspace ws = layout(id);
  if (!ws.valid()) return out;
  std::error_code ec;
  for (fs::directory_iterator it(ws.uploads, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code fec;
    if (!it->is_regular_file(fec)) continue;
    const std::string name = it->path().filename().string();
    if (name.empty() || name[0] == '.') continue;
    UploadEntry e;
    e.name = name;
    e.display_name = strip_timestamp_prefix(name);
    e.kind = file_kind_for_extension(file_extension(name));
    e.path = it->path().string();
    e.size = it->file_size(fec);
    e.mtime_unix_ms = to_unix_ms(it->last_write_time(fec));
    out.push_back(std::move(e));
  }
  std::sort(out.begin(), out.end(), [](const UploadEntry& a, const UploadEntry& b) {
    if (a.mtime_unix_ms != b.mtime_unix_ms) return a.mtime_unix_ms > b.mtime_unix_ms;
    return a.name > b.name;
  });
  return out;
}

std::optional<UploadEntry> WorkspaceStore::find_upload(const SessionId& id, const std::string& name) const {
  for (auto& e : list_uploads(id)) {
    if (e.name == name || e.display_name == name) return e;
  }
  return std::nullopt;
}

PathResolution WorkspaceStore::temp_path(const SessionId& id, const std::string& name) const {
  PathResolution out;
  const Workspace ws = layout(id);
  std::error_code ec;
  if (!ws.valid() || !fs::is_directory(ws.temp, ec)) {
    out.error = ErrorCode::not_found;
    out.detail = "no workspace for " + id;
    return out;
  }
  const std::string leaf = name.empty() ? "temp_" + random_hex(8) + ".tmp" : sanitize_filename(name);
  return resolve_path(leaf, ws.temp);
}

std::vector<std::pair<SessionId, uint64_t>> WorkspaceStore::scan() const {
  std::vector<std::pair<SessionId, uint64_t>> out;
  if (base_.empty()) return out;
  std::error_code ec;
  for (fs::directory_iterator it(base_, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code dec;
    if (!it->is_directory(dec) || it->is_symlink(dec)) continue;
    const std::string id = it->path().filename().string();
    if (!is_valid_session_id(id)) continue;
    out.emplace_back(id, newest_mtime(it->path()));
  }
  std::sort(out.begin(), out.end());
  return out;
}

}  // namespace cellar
