#pragma once

// assay/profiles.hpp — Experiment profile registry.
//
// A profile is a named command template. Callers never submit raw shell
// text: they name a profile and supply values for its declared {param}
// placeholders. Each value must match [A-Za-z0-9_./:\\-]+ before it is
// substituted, which is the only barrier between caller input and the
// shell. Do not widen that character set without reviewing every profile
// for quoting.
//
// FILE FORMAT (object keyed by profile id):
//   { "lint": { "command": "npx eslint {file}", "timeoutMs": 15000,
//               "description": "...", "cwd": "...", "params": ["file"],
//               "outputCapBytes": 65536 } }
//   timeout_ms / output_cap_bytes are accepted as aliases.

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "assay/types.hpp"

namespace assay {

using ProfileMap = std::map<std::string, ExperimentProfile>;
using EnvMap = std::map<std::string, std::string>;

constexpr std::uint64_t kDefaultProfileTimeoutMs = 30000;

struct LoadProfilesResult {
  bool ok{false};
  ErrorCode error{ErrorCode::none};
  std::string detail;
  std::string path;
  bool created{false};  // defaults were written on this call
  ProfileMap profiles;
  std::vector<std::string> profile_ids;  // sorted
};

struct ResolvedCommand {
  bool ok{false};
  ErrorCode error{ErrorCode::none};
  std::string profile_id;
  std::string param;  // offending parameter for invalid_or_missing_param
  ExperimentProfile profile;
  std::string command;
  std::string cwd;
  std::uint64_t timeout_ms{kDefaultProfileTimeoutMs};
};

// Built-in profiles written to a fresh profiles file.
ProfileMap default_profiles(const std::string& default_cwd);

// Normalises a raw profiles document. Entries with an empty id or command are
// dropped; see the file comment for accepted fields.
ProfileMap normalize_profiles(const std::string& json_text, const std::string& default_cwd,
                              bool* parse_ok);

std::string profiles_to_json(const ProfileMap& profiles);

// Ensures `path` exists (writing `defaults` on first run) and loads it.
LoadProfilesResult load_profiles(const std::string& path, const ProfileMap& defaults,
                                 const std::string& default_cwd);

bool is_valid_param_value(std::string_view value);

ResolvedCommand resolve_profile_and_command(const ExperimentRequest& request,
                                            const ProfileMap& profiles);

const std::vector<std::string>& baseline_env_keys();

// Minimal child environment: baseline keys plus `extra_keys`, copying only
// variables that are actually set in this process.
EnvMap build_experiment_env(const std::vector<std::string>& extra_keys);

// BLAKE3 over the sorted "key=value" lines joined by '\n'.
std::string fingerprint_env(const EnvMap& env);

}  // namespace assay
