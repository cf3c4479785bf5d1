#pragma once

// assay/types.hpp — Core data structures for the assay experiment runtime.
//
// ARCHITECTURE NOTES:
//
// LIFECYCLE:
//   ExperimentRequest  -> validated + resolved against a profile
//   ExperimentJob      -> immutable in-flight unit owned by the runtime queue
//   ExperimentRecord   -> durable row, one per run, never deleted
//
//   Record status moves strictly forward:
//     queued -> running -> {succeeded|failed|timed_out} -> {attached|attach_pending}
//   The final hop only happens when the job references a claim.
//
// MEMORY OWNERSHIP:
//   - All string members are value-owned. No borrowed references.
//   - Empty strings stand in for SQL NULL on text columns; the JSON renderers
//     emit null for them.
//
// CONCURRENCY NOTES:
//   - ExperimentJob is built on the caller thread and handed to the worker by
//     value. Nothing mutates it after enqueue.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace assay {

enum class ErrorCode {
  none,
  unavailable,
  profile_id_required,
  profile_not_found,
  invalid_or_missing_param,
  profiles_parse_failed,
  profiles_write_failed,
  queue_full,
  artifact_root_error,
  artifact_dir_error,
  db_init_failed,
  db_error,
  run_id_required,
  experiment_not_found,
  run_id_claim_id_relation_required,
  invalid_relation,
  evidence_event_missing,
  claim_not_found,
  invalid_transition,
  ledger_unavailable,
  ledger_invalid_event,
  spawn_failed,
  config_invalid,
};

std::string to_string(ErrorCode code);

enum class ExperimentStatus {
  queued,
  running,
  succeeded,
  failed,
  timed_out,
  canceled,
  attach_pending,
  attached,
};

std::string to_string(ExperimentStatus status);
std::optional<ExperimentStatus> parse_experiment_status(std::string_view text);

enum class EvidenceRelation {
  supports,
  contradicts,
  caused_by,
};

std::string to_string(EvidenceRelation relation);
std::optional<EvidenceRelation> parse_evidence_relation(std::string_view text);

enum class ClaimStatus {
  proposed,
  contested,
  pending_proof,
  confirmed,
  deprecated,
};

std::string to_string(ClaimStatus status);
std::optional<ClaimStatus> parse_claim_status(std::string_view text);

// Optional audit annotation carried by a job: which guard asked for the run
// and whether it was blocking the guarded action.
struct GuardContext {
  std::string guard_id;
  std::string action;
  bool blocking{false};

  // A context with no guard id, no action and blocking=false carries nothing.
  bool empty() const { return guard_id.empty() && action.empty() && !blocking; }
};

// One output-scrubbing rule. A literal rule matches its text verbatim; a
// pattern rule is an ECMAScript regex with JS-style flags (g, i, m).
// Flags default to "g" when left empty.
struct RedactionRule {
  std::string pattern;
  std::string flags;
  bool literal{false};
};

struct ExperimentProfile {
  std::string id;                 // lower-cased
  std::string command;            // may contain {param} placeholders
  std::uint64_t timeout_ms{30000};
  std::string cwd;
  std::optional<std::string> description;
  std::vector<std::string> params;  // lower-cased, deduplicated, declaration order
  std::optional<std::uint64_t> output_cap_bytes;
};

struct ExperimentRequest {
  std::string profile_id;
  std::map<std::string, std::string> args;
  std::string repo_path;                       // overrides profile cwd
  std::optional<std::uint64_t> timeout_ms;     // overrides profile timeout
  std::string requested_by{"system"};
  std::string claim_id;
  std::optional<EvidenceRelation> relation;
  std::string session;
  std::string idempotency_key;
  std::optional<GuardContext> guard;
  std::optional<std::uint64_t> output_cap_bytes;
  std::vector<RedactionRule> redaction_rules;
  std::string run_id;                          // caller-chosen; generated when empty
  std::optional<std::uint64_t> created_at_ms;
  std::vector<std::string> env_allowlist;      // extra keys beyond the baseline
  std::string trace_id;
  std::string parent_event_id;
};

struct ExperimentJob {
  std::string run_id;
  std::string profile_id;
  std::string command;
  std::string cwd;
  std::string requested_by;
  std::string claim_id;
  std::optional<EvidenceRelation> relation;
  std::string session;
  std::string idempotency_key;
  std::optional<GuardContext> guard;
  std::uint64_t timeout_ms{30000};
  std::uint64_t output_cap_bytes{0};
  std::vector<RedactionRule> redaction_rules;
  std::vector<std::string> env_allowlist;
  std::string trace_id;
  std::string parent_event_id;
  std::string artifact_dir;
  std::uint64_t created_at_ms{0};
};

// Best-effort description of the working tree a run executed in.
// Every field is absent when git is missing or the directory is not a repo.
struct GitFingerprint {
  std::optional<std::string> sha;
  std::optional<std::string> branch;
  std::optional<bool> dirty;
};

struct ExperimentRecord {
  std::string id;
  std::string idempotency_key;
  std::string claim_id;
  std::string profile_id;
  std::string command;
  std::string requested_by;
  std::optional<EvidenceRelation> relation;
  std::optional<GuardContext> guard;
  ExperimentStatus status{ExperimentStatus::queued};
  std::optional<int> exit_code;
  std::optional<std::uint64_t> duration_ms;
  std::string stdout_hash;
  std::string stderr_hash;
  std::string git_sha;
  std::string evidence_ref;
  std::string session;
  std::uint64_t timeout_ms{0};
  std::uint64_t output_cap_bytes{0};
  std::string artifact_dir;
  std::string cwd;
  std::uint64_t stdout_bytes{0};
  std::uint64_t stderr_bytes{0};
  bool truncated{false};
  bool redacted{false};
  std::string error_message;
  std::uint64_t created_at_ms{0};
  std::optional<std::uint64_t> updated_at_ms;
  std::optional<std::uint64_t> started_at_ms;
  std::optional<std::uint64_t> completed_at_ms;
};

// {"guardId","action","blocking"} as stored in the guard_context column.
std::string guard_to_json(const GuardContext& guard);
// Absent for empty/malformed text or a context that carries nothing.
std::optional<GuardContext> guard_from_json(const std::string& text);

// Wall-clock milliseconds since the Unix epoch.
std::uint64_t unix_now_ms();

// prefix + random RFC 4122 version-4 UUID text, e.g. "exp_3f1c...".
std::string random_id(const std::string& prefix);

// Append `entry` to a "; "-joined annotation. Empty entries are ignored.
void append_annotation(std::string& annotation, const std::string& entry);

}  // namespace assay
