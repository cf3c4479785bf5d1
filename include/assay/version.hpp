#pragma once

// assay/version.hpp — Version manifest for every persisted format.
//
// INVARIANT:
//   Every component that reads or writes a versioned format stamps or checks
//   its constant here. Opening a store written by a newer schema fails fast
//   (db_init_failed) instead of silently mis-reading columns.

#include <cstdint>
#include <string>

namespace assay {
namespace version {

// ---------------------------------------------------------------------------
// STORE_SCHEMA_VERSION
// Kept in SQLite's PRAGMA user_version. Version 1 = experiments table plus
// the claims/claim_evidence/claim_status_history tables.
// ---------------------------------------------------------------------------
constexpr uint32_t STORE_SCHEMA_VERSION = 1;

// ---------------------------------------------------------------------------
// ARTIFACT_META_VERSION
// Written as "meta_version" into meta.json and result.json.
// ---------------------------------------------------------------------------
constexpr uint32_t ARTIFACT_META_VERSION = 1;

// ---------------------------------------------------------------------------
// LEDGER_EVENT_VERSION
// Written as "v" into every evidence ledger NDJSON line.
// ---------------------------------------------------------------------------
constexpr uint32_t LEDGER_EVENT_VERSION = 1;

struct VersionManifest {
  uint32_t store_schema{STORE_SCHEMA_VERSION};
  uint32_t artifact_meta{ARTIFACT_META_VERSION};
  uint32_t ledger_event{LEDGER_EVENT_VERSION};
  std::string semver;
  std::string hash_primitive;
};

VersionManifest current_manifest();
std::string manifest_to_json(const VersionManifest& m);

struct CompatibilityResult {
  bool ok{true};
  std::string error_code;
  std::string description;
};

// Checks a schema version read back from an existing store.
// 0 means a fresh database and is always accepted.
CompatibilityResult check_store_schema(uint32_t found_version);

}  // namespace version
}  // namespace assay
