#pragma once

// assay/config.hpp — Runtime configuration.
//
// Every path the runtime touches is named here. Embedding hosts build a
// RuntimeConfig directly; the CLI starts from from_env() and lets flags
// override individual fields.
//
// ENVIRONMENT (all optional):
//   ASSAY_HOME              base directory for every default below (default ./.assay)
//   ASSAY_DB_PATH           SQLite store              (default $ASSAY_HOME/assay.db)
//   ASSAY_ARTIFACT_ROOT     per-run artifact dirs     (default $ASSAY_HOME/experiments)
//   ASSAY_PROFILES_PATH     profiles JSON file        (default $ASSAY_HOME/experiment-profiles.json)
//   ASSAY_LEDGER_PATH       evidence ledger NDJSON    (default $ASSAY_HOME/evidence-ledger.ndjson)
//   ASSAY_LEDGER_DISABLED=1 construct the ledger disabled (appends fail, runs land attach_pending)
//   ASSAY_EVENT_LOG         runtime event JSONL sink  (default: none)
//   ASSAY_LOG_STDERR=1      mirror warnings/errors to stderr
//   ASSAY_QUEUE_CAPACITY    bounded queue size        (default 256)

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace assay {

constexpr std::uint64_t kDefaultOutputCapBytes = 1024 * 1024;
constexpr std::size_t kDefaultQueueCapacity = 256;

struct RuntimeConfig {
  std::string home{".assay"};
  std::string db_path;
  std::string artifact_root;
  std::string profiles_path;
  std::string ledger_path;
  bool ledger_enabled{true};
  std::string default_profile_cwd;  // cwd for profiles that declare none
  std::string event_log_path;
  bool log_stderr{false};
  std::size_t queue_capacity{kDefaultQueueCapacity};
  std::uint64_t default_output_cap_bytes{kDefaultOutputCapBytes};

  // All paths derived from `home`; default_profile_cwd = current directory.
  static RuntimeConfig under(const std::string& home);

  // under($ASSAY_HOME) with individual ASSAY_* overrides applied.
  static RuntimeConfig from_env();

  // Returns one "field: problem" entry per invalid field. Empty = valid.
  std::vector<std::string> validate() const;
};

}  // namespace assay
