#pragma once

// cellar/session_identity.hpp — Login-free session id derivation.
//
// WEAK MODE (no client token):
//   id = "user_" + hex16(BLAKE3("sid:" || v1 \x1f user_agent \x1f platform \x1f hour_bucket))
//   Stable for identical inputs within one UTC hour; a new id MAY appear after
//   the hour boundary. Two users with identical user-agent and platform inside
//   the same hour receive the same id and share a workspace. This is a known
//   limitation of login-free identity, not a security boundary.
//
// TOKEN MODE (client_token non-empty):
//   id = "user_" + hex16(BLAKE3("tok:" || token))
//   No time bucket: stable for as long as the client keeps its token, and
//   free of the weak-signal collision window.

#include <cstddef>
#include <cstdint>
#include <string>

#include "cellar/types.hpp"

namespace cellar {

struct ClientSignature {
  std::string user_agent;
  std::string platform;      // coarse host tag, e.g. "linux", "Win32"
  std::string client_token;  // opaque value from the client's local cache; optional
};

constexpr std::size_t kSessionIdHexChars = 16;
constexpr const char* kSessionIdPrefix = "user_";

// Hour index since the Unix epoch.
uint64_t hour_bucket(uint64_t unix_ms);

SessionId derive_session_id(const ClientSignature& sig, uint64_t now_unix_ms);

// Keeps existing when it is a well-formed id, otherwise derives a new one.
SessionId derive_or_accept(const ClientSignature& sig, const std::string& existing,
                           uint64_t now_unix_ms);

}  // namespace cellar
