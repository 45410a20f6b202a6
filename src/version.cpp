#include "cellar/version.hpp"

#include <sstream>

namespace cellar {
namespace version {

VersionManifest current_manifest(const std::string& semver) {
  VersionManifest m;
  m.semver          = semver.empty() ? CELLAR_SEMVER : semver;
  m.hash_primitive  = "blake3";
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"workspace_layout\":" << m.workspace_layout
    << ",\"config_format\":" << m.config_format
    << ",\"session_id_scheme\":" << m.session_id_scheme
    << ",\"audit_log\":" << m.audit_log
    << ",\"semver\":\"" << m.semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace cellar
