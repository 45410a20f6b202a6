#pragma once

#include <string>
#include <string_view>

namespace cellar {

struct HashRuntimeInfo {
  std::string primitive;
  std::string backend;
  std::string version;
  bool blake3_available{false};
};

// Core BLAKE3 hashing (64-char lowercase hex).
std::string blake3_hex(std::string_view payload);
HashRuntimeInfo hash_runtime_info();

// Domain-separated hashing for different contexts. The prefixes are part of the
// derived-id contract: changing one changes every session id.
std::string hash_domain(std::string_view domain, std::string_view payload);
std::string session_signature_hash(std::string_view signature_material);
std::string client_token_hash(std::string_view token);
std::string audit_chain_hash(std::string_view record_line);

}  // namespace cellar
