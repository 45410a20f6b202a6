#include "cellar/types.hpp"

#include <algorithm>
#include <cctype>

namespace cellar {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::path_escape: return "path_escape";
    case ErrorCode::workspace_create_conflict: return "workspace_create_conflict";
    case ErrorCode::write_failed: return "write_failed";
    case ErrorCode::not_found: return "not_found";
    case ErrorCode::interception_leak: return "interception_leak";
    case ErrorCode::quota_exceeded: return "quota_exceeded";
    case ErrorCode::invalid_session_id: return "invalid_session_id";
    case ErrorCode::invalid_argument: return "invalid_argument";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::cancelled: return "cancelled";
  }
  return "";
}

bool is_valid_session_id(const std::string& id) {
  if (id.empty() || id.size() > 64) return false;
  for (char c : id) {
    if (!((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
          (c >= '0' && c <= '9') || c == '-' || c == '_')) {
      return false;
    }
  }
  return true;
}

std::string to_string(FileKind kind) {
  switch (kind) {
    case FileKind::excel: return "Excel";
    case FileKind::csv: return "CSV";
    case FileKind::text: return "Text";
    case FileKind::pdf: return "PDF";
    case FileKind::word: return "Word";
    case FileKind::other: return "Other";
  }
  return "Other";
}

FileKind file_kind_for_extension(const std::string& ext) {
  std::string e = ext;
  if (!e.empty() && e.front() == '.') e.erase(0, 1);
  std::transform(e.begin(), e.end(), e.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (e == "xlsx" || e == "xls" || e == "xlsm" || e == "xlsb") return FileKind::excel;
  if (e == "csv") return FileKind::csv;
  if (e == "txt" || e == "md") return FileKind::text;
  if (e == "pdf") return FileKind::pdf;
  if (e == "doc" || e == "docx") return FileKind::word;
  return FileKind::other;
}

}  // namespace cellar
