#pragma once

// assay/artifacts.hpp — Post-processing and persistence of run output.
//
// PIPELINE (per stream, in this order):
//   raw file -> redaction -> byte-cap truncation -> BLAKE3 -> atomic write
//
// INVARIANTS:
//   - The persisted log never exceeds the cap, and is exactly cap bytes when
//     truncation happened. The cut is made on bytes, so a multi-byte UTF-8
//     sequence may be split at the boundary.
//   - Hashes are computed over the persisted (redacted, capped) bytes, so
//     hash_file_blake3_hex(stdout.log) == stdout_hash.
//   - Every persisted file goes through atomic_write: readers never see a
//     partially written meta.json or log.

#include <cstdint>
#include <string>
#include <vector>

#include "assay/jsonlite.hpp"
#include "assay/types.hpp"

namespace assay {

struct ArtifactPaths {
  std::string dir;
  std::string stdout_raw;
  std::string stderr_raw;
  std::string stdout_log;
  std::string stderr_log;
  std::string meta;
  std::string result;
};

ArtifactPaths artifact_paths(const std::string& artifact_dir);

struct RedactionResult {
  std::string text;
  bool redacted{false};
};

constexpr const char* kRedactionMarker = "[REDACTED]";

// Rules whose pattern fails to compile are skipped.
RedactionResult apply_redaction(const std::string& text, const std::vector<RedactionRule>& rules);

// Escapes ECMAScript regex metacharacters.
std::string escape_regex(const std::string& literal);

// Accepts an array of strings (literal rules) and/or {"pattern","flags"}
// objects. Other entries are ignored.
std::vector<RedactionRule> redaction_rules_from_json(const jsonlite::Array& items);
jsonlite::Value redaction_rules_to_json(const std::vector<RedactionRule>& rules);

struct TruncateResult {
  std::string text;
  std::uint64_t bytes{0};
  bool truncated{false};
};

TruncateResult truncate_bytes(const std::string& text, std::uint64_t cap_bytes);

// Whole file, or "" when missing or unreadable.
std::string read_text_file_safe(const std::string& path);

// Write to a temp file in the same directory, then rename into place.
bool atomic_write(const std::string& target, const std::string& data);

// HEAD sha, branch and dirty flag via git. Any failure yields all nulls.
GitFingerprint git_fingerprint(const std::string& cwd);
jsonlite::Value git_to_json(const GitFingerprint& git);
GitFingerprint git_from_json(const jsonlite::Object* obj);

// Removes the transient raw capture files. Missing files are not an error.
void remove_raw_files(const ArtifactPaths& paths);

}  // namespace assay
