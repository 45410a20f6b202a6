#include "cellar/session_identity.hpp"

#include "cellar/hash.hpp"
#include "cellar/version.hpp"

namespace cellar {

namespace {
constexpr uint64_t kMsPerHour = 3600ull * 1000ull;
constexpr char kFieldSep = '\x1f';
}  // namespace

uint64_t hour_bucket(uint64_t unix_ms) { return unix_ms / kMsPerHour; }

SessionId derive_session_id(const ClientSignature& sig, uint64_t now_unix_ms) {
  if (!sig.client_token.empty()) {
    return std::string(kSessionIdPrefix) + client_token_hash(sig.client_token).substr(0, kSessionIdHexChars);
  }
  std::string material;
  material.reserve(sig.user_agent.size() + sig.platform.size() + 32);
  material += "v";
  material += std::to_string(version::SESSION_ID_SCHEME_VERSION);
  material += kFieldSep;
  material += sig.user_agent;
  material += kFieldSep;
  material += sig.platform;
  material += kFieldSep;
  material += std::to_string(hour_bucket(now_unix_ms));
  return std::string(kSessionIdPrefix) + session_signature_hash(material).substr(0, kSessionIdHexChars);
}

SessionId derive_or_accept(const ClientSignature& sig, const std::string& existing,
                           uint64_t now_unix_ms) {
  if (is_valid_session_id(existing)) return existing;
  return derive_session_id(sig, now_unix_ms);
}

}  // namespace cellar
