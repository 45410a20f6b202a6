#include "cellar/path_sandbox.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace cellar {

namespace {

constexpr std::size_t kMaxFilenameBytes = 100;
// Extensions longer than this are treated as part of the stem when truncating.
constexpr std::size_t kMaxExtensionBytes = 16;

bool starts_with(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool contained(const std::string& in, const std::string& base) {
  if (in == base) return true;
  // Root of the filesystem already ends in a separator.
  const std::string prefix = (!base.empty() && base.back() == '/') ? base : base + "/";
  return starts_with(in, prefix);
}

bool allowed_char(unsigned char c) {
  if (c >= 0x80) return true;  // UTF-8 multibyte sequences
  if (c >= 'a' && c <= 'z') return true;
  if (c >= 'A' && c <= 'Z') return true;
  if (c >= '0' && c <= '9') return true;
  return c == ' ' || c == '-' || c == '_' || c == '.';
}

// Cut at most max bytes without splitting a UTF-8 sequence.
std::string utf8_prefix(const std::string& s, std::size_t max) {
  if (s.size() <= max) return s;
  std::size_t n = max;
  while (n > 0 && (static_cast<unsigned char>(s[n]) & 0xC0) == 0x80) --n;
  return s.substr(0, n);
}

}  // namespace

PathResolution resolve_path(const std::string& candidate, const std::string& root) {
  PathResolution out;
  if (root.empty()) {
    out.error = ErrorCode::invalid_argument;
    out.detail = "empty sandbox root";
    return out;
  }
  if (candidate.find('\0') != std::string::npos || root.find('\0') != std::string::npos) {
    out.error = ErrorCode::path_escape;
    out.detail = "embedded NUL";
    return out;
  }

  std::error_code ec;
  const fs::path base = fs::weakly_canonical(fs::absolute(fs::path(root), ec), ec);
  if (ec) {
    out.error = ErrorCode::invalid_argument;
    out.detail = "cannot canonicalize root: " + ec.message();
    return out;
  }
  // An absolute candidate replaces base in operator/, which is what we want:
  // it is then checked like any other result.
  const fs::path in = candidate.empty() ? base : fs::weakly_canonical(base / candidate, ec);
  if (ec) {
    out.error = ErrorCode::path_escape;
    out.detail = "cannot canonicalize candidate: " + ec.message();
    return out;
  }

  std::string base_str = base.string();
  std::string in_str = in.string();
  // weakly_canonical keeps a trailing separator for "dir/"; drop it so
  // "a/" and "a" compare equal.
  while (in_str.size() > 1 && in_str.back() == '/') in_str.pop_back();
  while (base_str.size() > 1 && base_str.back() == '/') base_str.pop_back();

  if (!contained(in_str, base_str)) {
    out.error = ErrorCode::path_escape;
    out.detail = "'" + candidate + "' resolves outside sandbox root";
    return out;
  }
  out.path = in_str;
  return out;
}

bool is_within(const std::string& path, const std::string& root) {
  return resolve_path(path, root).ok();
}

std::string file_extension(const std::string& name) {
  const auto slash = name.find_last_of("/\\");
  const std::string base = slash == std::string::npos ? name : name.substr(slash + 1);
  const auto dot = base.rfind('.');
  if (dot == std::string::npos || dot == 0) return "";
  return base.substr(dot);
}

std::string sanitize_filename(const std::string& name) {
  const auto slash = name.find_last_of("/\\");
  const std::string base = slash == std::string::npos ? name : name.substr(slash + 1);

  std::string cleaned;
  cleaned.reserve(base.size());
  for (char c : base) {
    if (allowed_char(static_cast<unsigned char>(c))) cleaned.push_back(c);
  }
  const auto first = cleaned.find_first_not_of('.');
  cleaned = first == std::string::npos ? std::string() : cleaned.substr(first);
  while (!cleaned.empty() && cleaned.back() == ' ') cleaned.pop_back();

  if (cleaned.empty()) return "unnamed";
  if (cleaned.size() <= kMaxFilenameBytes) return cleaned;

  const auto dot = cleaned.rfind('.');
  if (dot != std::string::npos && dot > 0 && cleaned.size() - dot <= kMaxExtensionBytes) {
    const std::string ext = cleaned.substr(dot);
    return utf8_prefix(cleaned.substr(0, dot), kMaxFilenameBytes - ext.size()) + ext;
  }
  return utf8_prefix(cleaned, kMaxFilenameBytes);
}

}  // namespace cellar
