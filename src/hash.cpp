#include "cellar/hash.hpp"

// Hash authority for cellar.
//
// DESIGN INVARIANTS:
//   1. BLAKE3 is the sole hash primitive.
//   2. Domain separation: "sid:", "tok:", "aud:" prefixes keep session ids,
//      client-token ids and audit chain digests in disjoint hash spaces. A
//      client token equal to some signature string can never reproduce the
//      signature-derived id.

#include <array>

extern "C" {
#include <blake3.h>
}

namespace cellar {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.version = blake3_version();
  info.primitive = "blake3";
  info.backend = "system";
  info.blake3_available = true;
  return info;
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string session_signature_hash(std::string_view signature_material) {
  return hash_domain("sid:", signature_material);
}

std::string client_token_hash(std::string_view token) {
  return hash_domain("tok:", token);
}

std::string audit_chain_hash(std::string_view record_line) {
  return hash_domain("aud:", record_line);
}

}  // namespace cellar
