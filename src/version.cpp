#include "assay/version.hpp"

#include <sstream>

#ifndef ASSAY_VERSION
#define ASSAY_VERSION "0.0.0"
#endif

namespace assay {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.semver = ASSAY_VERSION;
  m.hash_primitive = "blake3";
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"store_schema\":" << m.store_schema
    << ",\"artifact_meta\":" << m.artifact_meta
    << ",\"ledger_event\":" << m.ledger_event
    << ",\"semver\":\"" << m.semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << "}";
  return o.str();
}

CompatibilityResult check_store_schema(uint32_t found_version) {
  CompatibilityResult r;
  if (found_version > STORE_SCHEMA_VERSION) {
    r.ok = false;
    r.error_code = "store_schema_newer";
    r.description = "Store schema version " + std::to_string(found_version) +
                    " is newer than supported version " +
                    std::to_string(STORE_SCHEMA_VERSION) + ".";
  }
  return r;
}

}  // namespace version
}  // namespace assay
