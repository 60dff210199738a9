#include "proofman/version.hpp"

#include <sstream>

#ifndef PROOFMAN_VERSION
#define PROOFMAN_VERSION "0.1.0"
#endif

namespace proofman {
namespace version {

VersionManifest current_manifest(const std::string& semver) {
  VersionManifest m;
  m.semver          = semver.empty() ? PROOFMAN_VERSION : semver;
  m.hash_primitive  = "blake3";
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"ledger_format\":" << m.ledger_format
    << ",\"event_format\":" << m.event_format
    << ",\"audit_log\":" << m.audit_log
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"semver\":\"" << m.semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace proofman
