#include "assay/types.hpp"

#include <chrono>
#include <cstdio>
#include <random>

#include "assay/jsonlite.hpp"

namespace assay {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::unavailable: return "unavailable";
    case ErrorCode::profile_id_required: return "profile_id_required";
    case ErrorCode::profile_not_found: return "profile_not_found";
    case ErrorCode::invalid_or_missing_param: return "invalid_or_missing_param";
    case ErrorCode::profiles_parse_failed: return "profiles_parse_failed";
    case ErrorCode::profiles_write_failed: return "profiles_write_failed";
    case ErrorCode::queue_full: return "queue_full";
    case ErrorCode::artifact_root_error: return "artifact_root_error";
    case ErrorCode::artifact_dir_error: return "artifact_dir_error";
    case ErrorCode::db_init_failed: return "db_init_failed";
    case ErrorCode::db_error: return "db_error";
    case ErrorCode::run_id_required: return "run_id_required";
    case ErrorCode::experiment_not_found: return "experiment_not_found";
    case ErrorCode::run_id_claim_id_relation_required: return "run_id_claim_id_relation_required";
    case ErrorCode::invalid_relation: return "invalid_relation";
    case ErrorCode::evidence_event_missing: return "evidence_event_missing";
    case ErrorCode::claim_not_found: return "claim_not_found";
    case ErrorCode::invalid_transition: return "invalid_transition";
    case ErrorCode::ledger_unavailable: return "ledger_unavailable";
    case ErrorCode::ledger_invalid_event: return "ledger_invalid_event";
    case ErrorCode::spawn_failed: return "spawn_failed";
    case ErrorCode::config_invalid: return "config_invalid";
  }
  return "";
}

std::string to_string(ExperimentStatus status) {
  switch (status) {
    case ExperimentStatus::queued: return "queued";
    case ExperimentStatus::running: return "running";
    case ExperimentStatus::succeeded: return "succeeded";
    case ExperimentStatus::failed: return "failed";
    case ExperimentStatus::timed_out: return "timed_out";
    case ExperimentStatus::canceled: return "canceled";
    case ExperimentStatus::attach_pending: return "attach_pending";
    case ExperimentStatus::attached: return "attached";
  }
  return "";
}

std::optional<ExperimentStatus> parse_experiment_status(std::string_view text) {
  if (text == "queued") return ExperimentStatus::queued;
  if (text == "running") return ExperimentStatus::running;
  if (text == "succeeded") return ExperimentStatus::succeeded;
  if (text == "failed") return ExperimentStatus::failed;
  if (text == "timed_out") return ExperimentStatus::timed_out;
  if (text == "canceled") return ExperimentStatus::canceled;
  if (text == "attach_pending") return ExperimentStatus::attach_pending;
  if (text == "attached") return ExperimentStatus::attached;
  return std::nullopt;
}

std::string to_string(EvidenceRelation relation) {
  switch (relation) {
    case EvidenceRelation::supports: return "supports";
    case EvidenceRelation::contradicts: return "contradicts";
    case EvidenceRelation::caused_by: return "caused_by";
  }
  return "";
}

std::optional<EvidenceRelation> parse_evidence_relation(std::string_view text) {
  if (text == "supports") return EvidenceRelation::supports;
  if (text == "contradicts") return EvidenceRelation::contradicts;
  if (text == "caused_by") return EvidenceRelation::caused_by;
  return std::nullopt;
}

std::string to_string(ClaimStatus status) {
  switch (status) {
    case ClaimStatus::proposed: return "proposed";
    case ClaimStatus::contested: return "contested";
    case ClaimStatus::pending_proof: return "pending_proof";
    case ClaimStatus::confirmed: return "confirmed";
    case ClaimStatus::deprecated: return "deprecated";
  }
  return "";
}

std::optional<ClaimStatus> parse_claim_status(std::string_view text) {
  if (text == "proposed") return ClaimStatus::proposed;
  if (text == "contested") return ClaimStatus::contested;
  if (text == "pending_proof") return ClaimStatus::pending_proof;
  if (text == "confirmed") return ClaimStatus::confirmed;
  if (text == "deprecated") return ClaimStatus::deprecated;
  return std::nullopt;
}

std::string guard_to_json(const GuardContext& guard) {
  jsonlite::Object o;
  o["guardId"] = jsonlite::str_or_null(guard.guard_id);
  o["action"] = jsonlite::str_or_null(guard.action);
  o["blocking"] = jsonlite::Value{guard.blocking};
  return jsonlite::to_json(o);
}

std::optional<GuardContext> guard_from_json(const std::string& text) {
  if (text.empty()) return std::nullopt;
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object o = jsonlite::parse(text, &err);
  if (err) return std::nullopt;
  GuardContext g;
  g.guard_id = jsonlite::get_string(o, "guardId");
  g.action = jsonlite::get_string(o, "action");
  g.blocking = jsonlite::get_bool(o, "blocking");
  if (g.empty()) return std::nullopt;
  return g;
}

std::uint64_t unix_now_ms() {
  using SC = std::chrono::system_clock;
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(SC::now().time_since_epoch())
          .count());
}

std::string random_id(const std::string& prefix) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  unsigned char bytes[16];
  for (int i = 0; i < 16; i += 8) {
    const std::uint64_t word = rng();
    for (int j = 0; j < 8; ++j) bytes[i + j] = static_cast<unsigned char>(word >> (j * 8));
  }
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);
  char buf[37];
  std::snprintf(buf, sizeof(buf),
                "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7],
                bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14],
                bytes[15]);
  return prefix + buf;
}

void append_annotation(std::string& annotation, const std::string& entry) {
  if (entry.empty()) return;
  if (!annotation.empty()) annotation += "; ";
  annotation += entry;
}

}  // namespace assay
