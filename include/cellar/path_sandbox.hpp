#pragma once

// cellar/path_sandbox.hpp — Confinement of untrusted path strings to a root.
//
// resolve() joins candidate onto root, canonicalizes both (.., ., symlinks of
// the existing prefix) and accepts the result only if it equals root or is a
// strict descendant of it. It never clamps: an escaping candidate is an error,
// not a shortened path.
//
// Absolute candidates are accepted only when they already canonicalize inside
// root. No directories or files are created.

#include <string>

#include "cellar/types.hpp"

namespace cellar {

struct PathResolution {
  std::string path;  // canonical, empty on error
  ErrorCode error{ErrorCode::none};
  std::string detail;

  bool ok() const { return error == ErrorCode::none; }
};

PathResolution resolve_path(const std::string& candidate, const std::string& root);

// True if path (canonicalized) equals root or lies beneath it.
bool is_within(const std::string& path, const std::string& root);

// Reduces an untrusted name to a single safe path component:
//   - directory parts (/ and \) are dropped; only the basename survives
//   - control characters and anything outside [A-Za-z0-9 _.-] or UTF-8
//     continuation bytes are removed
//   - leading dots are stripped (no hidden files, no "..")
//   - truncated to 100 bytes, keeping the extension
//   - an empty result becomes "unnamed"
std::string sanitize_filename(const std::string& name);

// ".xlsx" for "a/b/report.XLSX" (case preserved); empty when there is none.
std::string file_extension(const std::string& name);

}  // namespace cellar
