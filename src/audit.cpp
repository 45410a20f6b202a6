#include "cellar/audit.hpp"

#include <chrono>
#include <cstdio>
#include <fstream>
#include <mutex>
#include <sstream>

#include "cellar/hash.hpp"
#include "cellar/jsonlite.hpp"
#include "cellar/version.hpp"

namespace cellar {

namespace {
constexpr const char* kGenesisDigest =
    "0000000000000000000000000000000000000000000000000000000000000000";
}  // namespace

std::string audit_record_to_json(const FileAuditRecord& r) {
  std::ostringstream o;
  o << "{"
    << "\"seq\":" << r.sequence
    << ",\"prev\":\"" << r.previous_digest << "\""
    << ",\"v\":" << version::AUDIT_LOG_VERSION
    << ",\"session_id\":\"" << jsonlite::escape(r.session_id) << "\""
    << ",\"operation\":\"" << jsonlite::escape(r.operation) << "\""
    << ",\"requested_name\":\"" << jsonlite::escape(r.requested_name) << "\""
    << ",\"redirected_path\":\"" << jsonlite::escape(r.redirected_path) << "\""
    << ",\"ok\":" << (r.ok ? "true" : "false")
    << ",\"error_code\":\"" << r.error_code << "\""
    << ",\"bytes\":" << r.bytes
    << ",\"timestamp_unix_ms\":" << r.timestamp_unix_ms
    << "}";
  return o.str();
}

struct AuditLogImpl {
  std::mutex mu;
  FILE* file{nullptr};
  uint64_t seq{0};
  uint64_t entry_count{0};
  uint64_t failure_count{0};
  std::string last_digest{kGenesisDigest};
};

FileAuditLog::FileAuditLog(const std::string& path)
    : path_(path), impl_(std::make_unique<AuditLogImpl>()) {
  if (path_.empty()) return;
  // Continue an existing chain rather than restarting at genesis.
  std::ifstream in(path_);
  std::string line, last;
  uint64_t count = 0;
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    last = line;
    ++count;
  }
  if (!last.empty()) {
    impl_->last_digest = audit_chain_hash(last);
    impl_->seq = jsonlite::get_u64(jsonlite::parse(last), "seq", count);
  }
  impl_->file = std::fopen(path_.c_str(), "a");
}

FileAuditLog::~FileAuditLog() {
  if (impl_->file) {
    std::fclose(impl_->file);
    impl_->file = nullptr;
  }
}

bool FileAuditLog::enabled() const { return impl_->file != nullptr; }

bool FileAuditLog::append(FileAuditRecord& record) {
  std::lock_guard<std::mutex> lk(impl_->mu);
  if (!impl_->file) {
    // Not configured: silently skip.
    return true;
  }

  std::fseek(impl_->file, 0, SEEK_END);
  const long pre_write_pos = std::ftell(impl_->file);
  if (pre_write_pos < 0) {
    ++impl_->failure_count;
    return false;
  }

  record.sequence = impl_->seq + 1;
  record.previous_digest = impl_->last_digest;
  using SC = std::chrono::system_clock;
  record.timestamp_unix_ms = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(SC::now().time_since_epoch()).count());

  const std::string line = audit_record_to_json(record);
  const std::string final_line = line + "\n";
  const bool written =
      std::fwrite(final_line.data(), 1, final_line.size(), impl_->file) == final_line.size();
  std::fflush(impl_->file);

  if (!written) {
    ++impl_->failure_count;
    return false;
  }
  const long post_write_pos = std::ftell(impl_->file);
  if (post_write_pos >= 0 && post_write_pos < pre_write_pos + static_cast<long>(final_line.size())) {
    ++impl_->failure_count;
    return false;
  }
  impl_->seq = record.sequence;
  impl_->last_digest = audit_chain_hash(line);
  ++impl_->entry_count;
  return true;
}

uint64_t FileAuditLog::entry_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->entry_count;
}

uint64_t FileAuditLog::failure_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->failure_count;
}

AuditChainCheck verify_audit_chain(const std::string& path) {
  AuditChainCheck out;
  std::ifstream in(path);
  if (!in) {
    out.message = "cannot open " + path;
    return out;
  }
  std::string expected_prev = kGenesisDigest;
  uint64_t expected_seq = 0;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    std::optional<jsonlite::JsonError> err;
    const auto obj = jsonlite::parse(line, &err);
    const uint64_t seq = jsonlite::get_u64(obj, "seq");
    if (err) {
      out.first_bad_sequence = expected_seq + 1;
      out.message = "unparseable entry: " + err->message;
      return out;
    }
    if (expected_seq != 0 && seq != expected_seq + 1) {
      out.first_bad_sequence = seq;
      out.message = "sequence gap";
      return out;
    }
    if (jsonlite::get_string(obj, "prev") != expected_prev) {
      out.first_bad_sequence = seq;
      out.message = "chain digest mismatch";
      return out;
    }
    expected_prev = audit_chain_hash(line);
    expected_seq = seq;
    ++out.entries;
  }
  out.ok = true;
  return out;
}

}  // namespace cellar
