#pragma once

// assay/evidence.hpp — Links a finished run to the evidence ledger and, when
// the run names a claim, to that claim.
//
// Nothing here throws or fails the run. Every problem is reported as an
// annotation entry ("ledger_event_failed:<reason>",
// "claim_evidence_failed:<reason>", "claim_status_update_failed:<reason>")
// that the runtime appends to the row's error_message.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "assay/artifacts.hpp"
#include "assay/claims.hpp"
#include "assay/evidence_ledger.hpp"
#include "assay/types.hpp"

namespace assay {

constexpr const char* kExperimentEventType = "experiment.completed";
constexpr const char* kExperimentEventSource = "assay.experiment-worker";

// timed_out wins; then exit 0 -> succeeded; anything else -> failed.
ExperimentStatus derive_phase_status(bool timed_out, std::optional<int> exit_code);

// succeeded -> supports; failed/timed_out/canceled -> contradicts;
// otherwise the declared relation, defaulting to supports.
EvidenceRelation derive_evidence_relation(ExperimentStatus phase,
                                          std::optional<EvidenceRelation> declared);

std::string experiment_event_id(const std::string& run_id);
std::string experiment_trace_id(const std::string& run_id);

struct CompletedRun {
  std::string run_id;
  std::string claim_id;
  std::string profile_id;
  std::string command_preview;
  std::string requested_by;
  std::optional<GuardContext> guard;
  std::string session;
  ExperimentStatus phase_status{ExperimentStatus::failed};
  std::optional<int> exit_code;
  bool timed_out{false};
  std::uint64_t duration_ms{0};
  std::uint64_t completed_at_ms{0};
  ArtifactPaths files;
  std::uint64_t stdout_bytes{0};
  std::uint64_t stderr_bytes{0};
  bool truncated{false};
  bool redacted{false};
  std::string stdout_hash;
  std::string stderr_hash;
  GitFingerprint git;
  std::string trace_id;
  std::string parent_event_id;
};

LedgerEvent build_completed_event(const CompletedRun& run);

struct LedgerOutcome {
  bool ok{false};
  std::string status;    // inserted | duplicate
  std::string reason;
  std::string event_id;  // set only when ok
};

// Opens a ledger through `factory`, appends the run's event and closes the
// handle on every path.
LedgerOutcome append_completed_event(const LedgerFactory& factory, const std::string& ledger_path,
                                     bool ledger_enabled, const CompletedRun& run);

struct ClaimLinkOutcome {
  bool attached{false};
  std::string evidence_status;  // inserted | duplicate
  std::string evidence_reason;  // collaborator reason when !attached
  EvidenceRelation relation{EvidenceRelation::supports};
  std::optional<ClaimStatusUpdate> status_update;
  std::vector<std::string> annotations;
};

// Adds the evidence and applies the pending_proof transition:
//   pending_proof -> confirmed (phase succeeded) | contested (otherwise),
// with reason code "experiment_<phase>".
ClaimLinkOutcome link_evidence_to_claim(IClaimsCollaborator& claims, const std::string& claim_id,
                                        const std::string& evidence_ref,
                                        EvidenceRelation relation, ExperimentStatus phase,
                                        const std::string& actor, std::uint64_t now_ms);

// {"guardId","action","blocking"} or null.
jsonlite::Value guard_to_value(const std::optional<GuardContext>& guard);

jsonlite::Value claim_status_update_to_json(const std::optional<ClaimStatusUpdate>& update);

}  // namespace assay
