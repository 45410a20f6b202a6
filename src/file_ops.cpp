#include "cellar/file_ops.hpp"

#include <fstream>
#include <memory>

namespace cellar::fileops {

namespace {

Status write_verbatim(const std::string& path, const std::string& data) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  if (!ofs) return Status::failure(ErrorCode::write_failed, "cannot open " + path);
  ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
  ofs.close();
  if (!ofs) return Status::failure(ErrorCode::write_failed, "short write to " + path);
  return Status::success();
}

}  // namespace

bool intercepting() { return current_interception() != nullptr; }

OpenResult open_for_write(const std::string& path, bool binary) {
  if (auto* s = current_interception()) return s->open_for_write(path, binary);
  OpenResult out;
  auto mode = std::ios::out | std::ios::trunc;
  if (binary) mode |= std::ios::binary;
  auto stream = std::make_unique<std::ofstream>(path, mode);
  if (!*stream) {
    out.status = Status::failure(ErrorCode::write_failed, "cannot open " + path);
    return out;
  }
  out.stream = std::move(stream);
  out.path = path;
  return out;
}

Status export_table(const std::string& path, const Table& table) {
  if (auto* s = current_interception()) return s->export_table(path, table);
  return write_table_delimited(path, table);
}

Status dump_json(const std::string& path, const jsonlite::Value& value) {
  if (auto* s = current_interception()) return s->dump_json(path, value);
  return write_verbatim(path, jsonlite::to_json(value));
}

Status write_text(const std::string& path, const std::string& text) {
  if (auto* s = current_interception()) return s->write_text(path, text);
  return write_verbatim(path, text);
}

}  // namespace cellar::fileops
