#include "assay/evidence.hpp"

namespace assay {

ExperimentStatus derive_phase_status(bool timed_out, std::optional<int> exit_code) {
  if (timed_out) return ExperimentStatus::timed_out;
  if (exit_code && *exit_code == 0) return ExperimentStatus::succeeded;
  return ExperimentStatus::failed;
}

EvidenceRelation derive_evidence_relation(ExperimentStatus phase,
                                          std::optional<EvidenceRelation> declared) {
  switch (phase) {
    case ExperimentStatus::succeeded:
      return EvidenceRelation::supports;
    case ExperimentStatus::failed:
    case ExperimentStatus::timed_out:
    case ExperimentStatus::canceled:
      return EvidenceRelation::contradicts;
    default:
      return declared.value_or(EvidenceRelation::supports);
  }
}

std::string experiment_event_id(const std::string& run_id) { return "evt_experiment_" + run_id; }

std::string experiment_trace_id(const std::string& run_id) { return "trc_experiment_" + run_id; }

LedgerEvent build_completed_event(const CompletedRun& run) {
  using jsonlite::Value;
  LedgerEvent ev;
  ev.event_id = experiment_event_id(run.run_id);
  if (!run.trace_id.empty()) {
    ev.trace_id = run.trace_id;
  } else if (run.guard && !run.guard->guard_id.empty()) {
    ev.trace_id = run.guard->guard_id;
  } else {
    ev.trace_id = experiment_trace_id(run.run_id);
  }
  ev.parent_event_id = run.parent_event_id;
  ev.type = kExperimentEventType;
  ev.stage = "experiment";
  ev.source = kExperimentEventSource;
  ev.pane_id = "2";
  ev.role = run.requested_by.empty() ? std::string("system") : run.requested_by;
  ev.direction = "internal";
  ev.ts_ms = run.completed_at_ms;

  jsonlite::Object output;
  output["stdoutBytes"] = Value{run.stdout_bytes};
  output["stderrBytes"] = Value{run.stderr_bytes};
  output["truncated"] = Value{run.truncated};
  output["redacted"] = Value{run.redacted};

  jsonlite::Object hashes;
  hashes["stdout"] = Value{run.stdout_hash};
  hashes["stderr"] = Value{run.stderr_hash};

  jsonlite::Object files;
  files["stdout"] = Value{run.files.stdout_log};
  files["stderr"] = Value{run.files.stderr_log};
  files["meta"] = Value{run.files.meta};
  files["result"] = Value{run.files.result};

  jsonlite::Object& p = ev.payload;
  p["runId"] = Value{run.run_id};
  p["claimId"] = jsonlite::str_or_null(run.claim_id);
  p["profileId"] = Value{run.profile_id};
  p["status"] = Value{to_string(run.phase_status)};
  p["exitCode"] = run.exit_code ? jsonlite::int_value(*run.exit_code) : Value{nullptr};
  p["timedOut"] = Value{run.timed_out};
  p["durationMs"] = Value{run.duration_ms};
  p["artifactDir"] = Value{run.files.dir};
  p["commandPreview"] = Value{run.command_preview};
  p["output"] = Value{std::move(output)};
  p["hashes"] = Value{std::move(hashes)};
  p["files"] = Value{std::move(files)};
  p["guardContext"] = guard_to_value(run.guard);
  p["git"] = git_to_json(run.git);

  ev.evidence_refs = {
      {"file", run.files.stdout_log, run.stdout_hash, "experiment stdout"},
      {"file", run.files.stderr_log, run.stderr_hash, "experiment stderr"},
      {"file", run.files.meta, "", "experiment metadata"},
  };

  ev.meta["runId"] = Value{run.run_id};
  ev.meta["guardId"] = run.guard ? jsonlite::str_or_null(run.guard->guard_id) : Value{nullptr};
  ev.meta["action"] = run.guard ? jsonlite::str_or_null(run.guard->action) : Value{nullptr};
  return ev;
}

LedgerOutcome append_completed_event(const LedgerFactory& factory, const std::string& ledger_path,
                                     bool ledger_enabled, const CompletedRun& run) {
  LedgerOutcome out;
  std::unique_ptr<IEvidenceLedger> ledger = factory ? factory(ledger_path, ledger_enabled) : nullptr;
  if (!ledger) {
    out.reason = to_string(ErrorCode::ledger_unavailable);
    return out;
  }
  const LedgerInitResult init = ledger->init();
  if (!init.ok) {
    ledger->close();
    out.reason = init.reason.empty() ? to_string(ErrorCode::ledger_unavailable) : init.reason;
    return out;
  }

  LedgerAppendOptions opts;
  opts.session_id = run.session;
  opts.now_ms = run.completed_at_ms;
  const LedgerAppendResult appended = ledger->append_event(build_completed_event(run), opts);
  ledger->close();
  if (!appended.ok) {
    out.reason = !appended.reason.empty() ? appended.reason
                 : !appended.status.empty() ? appended.status
                                            : std::string("ledger_append_failed");
    return out;
  }
  out.ok = true;
  out.status = appended.status.empty() ? std::string("inserted") : appended.status;
  out.event_id = experiment_event_id(run.run_id);
  return out;
}

ClaimLinkOutcome link_evidence_to_claim(IClaimsCollaborator& claims, const std::string& claim_id,
                                        const std::string& evidence_ref,
                                        EvidenceRelation relation, ExperimentStatus phase,
                                        const std::string& actor, std::uint64_t now_ms) {
  ClaimLinkOutcome out;
  out.relation = relation;
  const std::string who = actor.empty() ? std::string("system") : actor;

  AddEvidenceOptions opts;
  opts.added_by = who;
  opts.now_ms = now_ms;
  const AddEvidenceResult added = claims.add_evidence(claim_id, evidence_ref, relation, opts);
  if (!added.ok) {
    out.evidence_reason = added.reason.empty() ? std::string("unknown") : added.reason;
    out.annotations.push_back("claim_evidence_failed:" + out.evidence_reason);
    return out;
  }
  out.attached = true;
  out.evidence_status = added.status;

  const auto snapshot = claims.get_claim(claim_id);
  if (snapshot && snapshot->status == ClaimStatus::pending_proof) {
    const ClaimStatus next =
        phase == ExperimentStatus::succeeded ? ClaimStatus::confirmed : ClaimStatus::contested;
    ClaimStatusUpdate update =
        claims.update_claim_status(claim_id, next, who, "experiment_" + to_string(phase), now_ms);
    if (!update.ok) {
      out.annotations.push_back("claim_status_update_failed:" +
                                (update.reason.empty() ? std::string("unknown") : update.reason));
    }
    out.status_update = std::move(update);
  }
  return out;
}

jsonlite::Value guard_to_value(const std::optional<GuardContext>& guard) {
  if (!guard) return jsonlite::Value{nullptr};
  jsonlite::Object o;
  o["guardId"] = jsonlite::str_or_null(guard->guard_id);
  o["action"] = jsonlite::str_or_null(guard->action);
  o["blocking"] = jsonlite::Value{guard->blocking};
  return jsonlite::Value{std::move(o)};
}

jsonlite::Value claim_status_update_to_json(const std::optional<ClaimStatusUpdate>& update) {
  using jsonlite::Value;
  if (!update) return Value{nullptr};
  jsonlite::Object o;
  o["ok"] = Value{update->ok};
  o["status"] = Value{to_string(update->status)};
  o["previous"] = update->previous ? Value{to_string(*update->previous)} : Value{nullptr};
  o["noChange"] = Value{update->no_change};
  o["reason"] = jsonlite::str_or_null(update->reason);
  return Value{std::move(o)};
}

}  // namespace assay
