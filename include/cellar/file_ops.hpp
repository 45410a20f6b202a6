#pragma once

// cellar/file_ops.hpp — Ambient file-producing operations.
//
// Code that cannot be handed an ExecutionContext calls these instead. While a
// ScopedInterception is alive on the calling thread they route to that
// session (redirected into exports/). Otherwise they write exactly the path
// given, so behaviour outside an execution is untouched.

#include <string>

#include "cellar/interceptor.hpp"
#include "cellar/jsonlite.hpp"
#include "cellar/types.hpp"

namespace cellar::fileops {

bool intercepting();

OpenResult open_for_write(const std::string& path, bool binary = false);
Status export_table(const std::string& path, const Table& table);
Status dump_json(const std::string& path, const jsonlite::Value& value);
Status write_text(const std::string& path, const std::string& text);

}  // namespace cellar::fileops
