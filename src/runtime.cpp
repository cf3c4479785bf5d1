#include "assay/runtime.hpp"

// Execution order for one job (worker thread):
//   1. mark_running + started event
//   2. child env (allow-listed) + env fingerprint
//   3. shell invocation in a pseudo-terminal, raw streams redirected to files
//   4. redaction -> byte cap -> BLAKE3 per stream, git fingerprint
//   5. capped logs written atomically
//   6. ledger event, then claim evidence + pending_proof transition
//   7. meta.json / result.json, meta cache
//   8. delete raw files, finalize row, completed event
// Steps 6-7 never fail the run; problems accumulate in the row annotation.

#include <chrono>
#include <exception>
#include <filesystem>
#include <utility>

#include "assay/artifacts.hpp"
#include "assay/evidence.hpp"
#include "assay/hash.hpp"
#include "assay/version.hpp"

namespace fs = std::filesystem;

namespace assay {

namespace {

constexpr std::uint64_t kWaitPollMs = 25;

jsonlite::Value u64_or_null(const std::optional<std::uint64_t>& v) {
  return v ? jsonlite::Value{*v} : jsonlite::Value{nullptr};
}

jsonlite::Value relation_or_null(const std::optional<EvidenceRelation>& relation) {
  return relation ? jsonlite::Value{to_string(*relation)} : jsonlite::Value{nullptr};
}

bool is_execution_terminal(ExperimentStatus status) {
  return status == ExperimentStatus::succeeded || status == ExperimentStatus::failed ||
         status == ExperimentStatus::timed_out || status == ExperimentStatus::canceled;
}

// Phase of a finished row whose status has already moved on to
// attach_pending. The exit code alone cannot tell a timeout apart, so the
// annotation written at completion is consulted first.
ExperimentStatus phase_of_record(const ExperimentRecord& rec) {
  if (is_execution_terminal(rec.status)) return rec.status;
  if (rec.error_message.find("Timed out after") != std::string::npos) {
    return ExperimentStatus::timed_out;
  }
  return derive_phase_status(false, rec.exit_code);
}

std::string lower_trim(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && (s[b] == ' ' || s[b] == '\t')) ++b;
  while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) --e;
  std::string out = s.substr(b, e - b);
  for (auto& c : out) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return out;
}

// Caller-chosen run ids become a directory name under the artifact root,
// so only a flat name is accepted: [A-Za-z0-9_.-], not starting with '.'.
bool is_valid_run_id(const std::string& id) {
  if (id.empty() || id.size() > 128 || id.front() == '.') return false;
  for (unsigned char c : id) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') || c == '_' || c == '-' || c == '.';
    if (!ok) return false;
  }
  return true;
}

jsonlite::Object error_object(ErrorCode error) {
  jsonlite::Object o;
  o["ok"] = jsonlite::Value{false};
  o["error"] = jsonlite::Value{to_string(error)};
  return o;
}

}  // namespace

std::string to_string(CreateOutcome outcome) {
  switch (outcome) {
    case CreateOutcome::started: return "started";
    case CreateOutcome::queued: return "queued";
    case CreateOutcome::duplicate: return "duplicate";
    case CreateOutcome::rejected: return "rejected";
  }
  return "rejected";
}

// ---------------------------------------------------------------------------
// Result rendering
// ---------------------------------------------------------------------------

jsonlite::Object experiment_summary_json(const ExperimentRecord& r) {
  using jsonlite::Value;
  jsonlite::Object o;
  o["runId"] = Value{r.id};
  o["profileId"] = jsonlite::str_or_null(r.profile_id);
  o["status"] = Value{to_string(r.status)};
  o["requestedBy"] = Value{r.requested_by.empty() ? std::string("system") : r.requested_by};
  o["claimId"] = jsonlite::str_or_null(r.claim_id);
  o["relation"] = relation_or_null(r.relation);
  o["guardContext"] = guard_to_value(r.guard);
  o["createdAt"] = Value{r.created_at_ms};
  o["startedAt"] = u64_or_null(r.started_at_ms);
  o["finishedAt"] = u64_or_null(r.completed_at_ms);
  o["exitCode"] = r.exit_code ? jsonlite::int_value(*r.exit_code) : Value{nullptr};
  o["durationMs"] = u64_or_null(r.duration_ms);
  o["timeoutMs"] = Value{r.timeout_ms};
  o["commandPreview"] = jsonlite::str_or_null(r.command);
  o["artifactDir"] = Value{r.artifact_dir};

  jsonlite::Object output;
  output["stdoutBytes"] = Value{r.stdout_bytes};
  output["stderrBytes"] = Value{r.stderr_bytes};
  output["truncated"] = Value{r.truncated};
  output["redacted"] = Value{r.redacted};
  o["output"] = Value{std::move(output)};

  jsonlite::Object attach;
  attach["evidenceEventId"] = jsonlite::str_or_null(r.evidence_ref);
  attach["claimEvidenceStatus"] = r.status == ExperimentStatus::attached
                                      ? Value{std::string("attached")}
                                      : Value{nullptr};
  o["attach"] = Value{std::move(attach)};
  return o;
}

std::string CreateResult::to_json() const {
  using jsonlite::Value;
  if (!ok) {
    jsonlite::Object o = error_object(error);
    if (!param.empty()) o["param"] = Value{param};
    if (!detail.empty()) o["detail"] = Value{detail};
    return jsonlite::to_json(o);
  }
  jsonlite::Object o;
  o["ok"] = Value{true};
  o["outcome"] = Value{to_string(outcome)};
  o["runId"] = Value{run_id};
  o["status"] = Value{to_string(status)};
  o["queued"] = Value{queued};
  o["artifactDir"] = Value{artifact_dir};
  return jsonlite::to_json(o);
}

std::string GetResult::to_json() const {
  using jsonlite::Value;
  if (!ok) return jsonlite::to_json(error_object(error));
  jsonlite::Object exp = experiment_summary_json(record);
  exp["cwd"] = jsonlite::str_or_null(cwd);
  exp["git"] = git_to_json(git);
  const ArtifactPaths files = artifact_paths(record.artifact_dir);
  jsonlite::Object f;
  f["stdout"] = Value{files.stdout_log};
  f["stderr"] = Value{files.stderr_log};
  f["meta"] = Value{files.meta};
  f["result"] = Value{files.result};
  exp["files"] = Value{std::move(f)};
  exp["error"] = jsonlite::str_or_null(error_message);

  jsonlite::Object o;
  o["ok"] = Value{true};
  o["experiment"] = Value{std::move(exp)};
  return jsonlite::to_json(o);
}

std::string ListResult::to_json() const {
  using jsonlite::Value;
  if (!ok) return jsonlite::to_json(error_object(error));
  jsonlite::Array rows;
  for (const auto& r : experiments) rows.push_back(Value{experiment_summary_json(r)});
  jsonlite::Object o;
  o["ok"] = Value{true};
  o["experiments"] = Value{std::move(rows)};
  o["nextCursor"] = jsonlite::str_or_null(next_cursor);
  return jsonlite::to_json(o);
}

std::string AttachResult::to_json() const {
  using jsonlite::Value;
  if (!ok) {
    jsonlite::Object o = error_object(error);
    if (!reason.empty()) o["reason"] = Value{reason};
    return jsonlite::to_json(o);
  }
  jsonlite::Object o;
  o["ok"] = Value{true};
  o["runId"] = Value{run_id};
  o["claimId"] = Value{claim_id};
  o["relation"] = Value{to_string(relation)};
  o["status"] = Value{status};
  o["evidenceEventId"] = jsonlite::str_or_null(evidence_event_id);
  o["claimStatusUpdate"] = claim_status_update_to_json(claim_status_update);
  return jsonlite::to_json(o);
}

std::string HealthStatus::to_json() const {
  using jsonlite::Value;
  jsonlite::Object o;
  o["ok"] = Value{ok};
  o["available"] = Value{available};
  o["running"] = Value{running};
  o["currentRunId"] = jsonlite::str_or_null(current_run_id);
  o["queued"] = Value{static_cast<std::uint64_t>(queued)};
  o["queueCapacity"] = Value{static_cast<std::uint64_t>(queue_capacity)};
  o["profileCount"] = Value{static_cast<std::uint64_t>(profile_count)};
  o["staleRunning"] = Value{stale_running};
  o["dbPath"] = Value{db_path};
  o["artifactRoot"] = Value{artifact_root};
  o["profilesPath"] = Value{profiles_path};
  o["ledgerPath"] = Value{ledger_path};
  o["ledgerEnabled"] = Value{ledger_enabled};
  o["stats"] = stats_json.empty() ? Value{nullptr} : jsonlite::parse_value(stats_json, nullptr);
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// ExperimentRuntime
// ---------------------------------------------------------------------------

ExperimentRuntime::ExperimentRuntime(RuntimeConfig config, RuntimeOptions options)
    : config_(std::move(config)),
      options_(std::move(options)),
      sink_(config_.event_log_path, config_.log_stderr) {
  if (!options_.kill_process_tree) options_.kill_process_tree = assay::kill_process_tree;
  if (!options_.ledger_factory) options_.ledger_factory = default_ledger_factory();
}

ExperimentRuntime::~ExperimentRuntime() { close(); }

InitResult ExperimentRuntime::open() {
  InitResult r;
  if (available_.load()) {
    r.ok = true;
    return r;
  }

  const auto problems = config_.validate();
  if (!problems.empty()) {
    r.error = ErrorCode::config_invalid;
    r.reason = problems.front();
    return r;
  }

  const InitResult db = db_.open(config_.db_path, unix_now_ms());
  if (!db.ok) return db;

  if (options_.claims) {
    claims_ = options_.claims;
  } else {
    if (!owned_claims_) owned_claims_ = std::make_unique<SqliteClaimStore>(db_);
    claims_ = owned_claims_.get();
  }

  const ProfileMap defaults = options_.default_profiles.empty()
                                  ? default_profiles(config_.default_profile_cwd)
                                  : options_.default_profiles;
  LoadProfilesResult loaded =
      load_profiles(config_.profiles_path, defaults, config_.default_profile_cwd);
  if (!loaded.ok) {
    db_.close();
    r.error = loaded.error;
    r.reason = to_string(loaded.error);
    if (!loaded.detail.empty()) r.reason += ": " + loaded.detail;
    return r;
  }
  profiles_ = std::move(loaded.profiles);
  profile_ids_ = std::move(loaded.profile_ids);

  std::error_code ec;
  fs::create_directories(config_.artifact_root, ec);
  if (ec || !fs::is_directory(config_.artifact_root)) {
    db_.close();
    r.error = ErrorCode::artifact_root_error;
    r.reason = ec ? ec.message() : std::string("not a directory");
    return r;
  }

  {
    std::lock_guard<std::mutex> lk(mu_);
    stopping_ = false;
    queue_.clear();
    current_run_id_.clear();
  }
  worker_done_.store(false);
  worker_ = std::thread(&ExperimentRuntime::worker_loop, this);
  available_.store(true);
  r.ok = true;
  return r;
}

void ExperimentRuntime::close() {
  available_.store(false);
  {
    std::lock_guard<std::mutex> lk(mu_);
    stopping_ = true;
    queue_.clear();
  }
  cv_.notify_all();

  if (worker_.joinable()) {
    // The worker may be between popping a job and publishing its pid, so keep
    // watching until it exits and kill each child that appears.
    ProcessId killed = 0;
    while (!worker_done_.load()) {
      const ProcessId pid = current_pid_.load();
      if (pid > 0 && pid != killed) {
        kill_tree(pid);
        killed = pid;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    worker_.join();
  }

  {
    std::lock_guard<std::mutex> lk(mu_);
    current_run_id_.clear();
    meta_cache_.clear();
  }
  db_.close();
}

void ExperimentRuntime::kill_tree(ProcessId pid) {
  stats_.kills.fetch_add(1, std::memory_order_relaxed);
  try {
    options_.kill_process_tree(pid);
  } catch (const std::exception& e) {
    RuntimeEvent ev;
    ev.kind = RuntimeEventKind::integration_warning;
    ev.detail = std::string("kill_failed:") + e.what();
    emit(std::move(ev));
  }
}

void ExperimentRuntime::emit(RuntimeEvent ev) {
  if (ev.ts_ms == 0) ev.ts_ms = unix_now_ms();
  sink_.emit(ev, stats_);
}

HealthStatus ExperimentRuntime::health() {
  HealthStatus h;
  h.available = available_.load();
  h.ok = h.available;
  {
    std::lock_guard<std::mutex> lk(mu_);
    h.running = !current_run_id_.empty();
    h.current_run_id = current_run_id_;
    h.queued = queue_.size();
  }
  h.queue_capacity = config_.queue_capacity;
  h.profile_count = profiles_.size();
  if (h.available) {
    const std::uint64_t running_rows = store_.count_with_status(ExperimentStatus::running);
    const std::uint64_t live = h.running ? 1 : 0;
    h.stale_running = running_rows > live ? running_rows - live : 0;
  }
  h.db_path = config_.db_path;
  h.artifact_root = config_.artifact_root;
  h.profiles_path = config_.profiles_path;
  h.ledger_path = config_.ledger_path;
  h.ledger_enabled = config_.ledger_enabled;
  h.stats_json = stats_.to_json();
  return h;
}

CreateResult ExperimentRuntime::create(const ExperimentRequest& request) {
  std::lock_guard<std::mutex> submit(submit_mu_);
  CreateResult out;

  auto reject = [&](ErrorCode code, const std::string& detail) {
    out.ok = false;
    out.outcome = CreateOutcome::rejected;
    out.error = code;
    out.detail = detail;
    RuntimeEvent ev;
    ev.kind = RuntimeEventKind::rejected;
    ev.profile_id = request.profile_id;
    ev.error_code = to_string(code);
    ev.detail = detail;
    emit(std::move(ev));
    return out;
  };

  if (!available_.load()) return reject(ErrorCode::unavailable, "");

  const ResolvedCommand resolved = resolve_profile_and_command(request, profiles_);
  if (!resolved.ok) {
    out.param = resolved.param;
    return reject(resolved.error, resolved.param);
  }

  auto duplicate_of = [&](const ExperimentRecord& existing) {
    out.ok = true;
    out.outcome = CreateOutcome::duplicate;
    out.run_id = existing.id;
    out.status = existing.status;
    out.queued = existing.status == ExperimentStatus::queued ||
                 existing.status == ExperimentStatus::running;
    out.artifact_dir = existing.artifact_dir;
    RuntimeEvent ev;
    ev.kind = RuntimeEventKind::duplicate;
    ev.run_id = existing.id;
    ev.profile_id = existing.profile_id;
    ev.status = to_string(existing.status);
    emit(std::move(ev));
    return out;
  };

  if (!request.run_id.empty()) {
    if (!is_valid_run_id(request.run_id)) {
      out.param = "runId";
      return reject(ErrorCode::invalid_or_missing_param, "runId");
    }
    if (auto existing = store_.get(request.run_id)) return duplicate_of(*existing);
  }

  if (!request.idempotency_key.empty()) {
    if (auto existing = store_.find_by_idempotency_key(request.idempotency_key)) {
      return duplicate_of(*existing);
    }
  }

  bool full = false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    full = queue_.size() >= config_.queue_capacity;
  }
  if (full) {
    return reject(ErrorCode::queue_full, "capacity " + std::to_string(config_.queue_capacity));
  }

  ExperimentJob job;
  job.run_id = request.run_id.empty() ? random_id("exp_") : request.run_id;
  job.profile_id = resolved.profile_id;
  job.command = resolved.command;
  job.cwd = resolved.cwd;
  job.requested_by = request.requested_by.empty() ? std::string("system") : request.requested_by;
  job.claim_id = request.claim_id;
  job.relation = request.relation;
  job.session = request.session;
  job.idempotency_key = request.idempotency_key;
  if (request.guard && !request.guard->empty()) job.guard = request.guard;
  job.timeout_ms = resolved.timeout_ms;
  job.output_cap_bytes = request.output_cap_bytes.value_or(
      resolved.profile.output_cap_bytes.value_or(config_.default_output_cap_bytes));
  if (job.output_cap_bytes == 0) job.output_cap_bytes = config_.default_output_cap_bytes;
  job.redaction_rules = request.redaction_rules;
  job.env_allowlist = request.env_allowlist;
  job.trace_id = request.trace_id;
  job.parent_event_id = request.parent_event_id;
  job.artifact_dir = (fs::path(config_.artifact_root) / job.run_id).string();
  job.created_at_ms = request.created_at_ms.value_or(unix_now_ms());

  // Directory first: a run that cannot hold artifacts is never persisted.
  std::error_code ec;
  const bool created_dir = fs::create_directories(job.artifact_dir, ec);
  if (ec || !fs::is_directory(job.artifact_dir)) {
    return reject(ErrorCode::artifact_dir_error, ec ? ec.message() : job.artifact_dir);
  }

  ExperimentRecord rec;
  rec.id = job.run_id;
  rec.idempotency_key = job.idempotency_key;
  rec.claim_id = job.claim_id;
  rec.profile_id = job.profile_id;
  rec.command = job.command;
  rec.requested_by = job.requested_by;
  rec.relation = job.relation;
  rec.guard = job.guard;
  rec.status = ExperimentStatus::queued;
  rec.session = job.session;
  rec.timeout_ms = job.timeout_ms;
  rec.output_cap_bytes = job.output_cap_bytes;
  rec.artifact_dir = job.artifact_dir;
  rec.cwd = job.cwd;
  rec.created_at_ms = job.created_at_ms;
  rec.updated_at_ms = job.created_at_ms;

  if (!store_.insert(rec)) {
    const std::string db_reason = db_.last_error();
    // Only a directory this call created is removed; an existing one may
    // hold another run's artifacts.
    if (created_dir) fs::remove_all(job.artifact_dir, ec);
    // Lost a race on the primary key or the idempotency index: report the
    // winner.
    if (auto existing = store_.get(job.run_id)) return duplicate_of(*existing);
    if (!job.idempotency_key.empty()) {
      if (auto existing = store_.find_by_idempotency_key(job.idempotency_key)) {
        return duplicate_of(*existing);
      }
    }
    return reject(ErrorCode::db_error, db_reason);
  }

  bool busy = false;
  std::size_t depth = 0;
  {
    std::lock_guard<std::mutex> lk(mu_);
    busy = !current_run_id_.empty() || !queue_.empty();
    queue_.push_back(job);
    depth = queue_.size();
  }
  cv_.notify_one();

  out.ok = true;
  out.outcome = busy ? CreateOutcome::queued : CreateOutcome::started;
  out.run_id = job.run_id;
  out.status = busy ? ExperimentStatus::queued : ExperimentStatus::running;
  out.queued = busy;
  out.artifact_dir = job.artifact_dir;

  RuntimeEvent ev;
  ev.kind = RuntimeEventKind::queued;
  ev.run_id = job.run_id;
  ev.profile_id = job.profile_id;
  ev.status = to_string(out.status);
  ev.queue_depth = depth;
  emit(std::move(ev));
  return out;
}

void ExperimentRuntime::worker_loop() {
  while (true) {
    ExperimentJob job;
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      if (stopping_) break;
      job = std::move(queue_.front());
      queue_.pop_front();
      current_run_id_ = job.run_id;
    }

    try {
      run_job(job);
    } catch (const std::exception& e) {
      RuntimeEvent ev;
      ev.kind = RuntimeEventKind::worker_error;
      ev.run_id = job.run_id;
      ev.profile_id = job.profile_id;
      ev.detail = e.what();
      emit(std::move(ev));
    }

    std::lock_guard<std::mutex> lk(mu_);
    current_run_id_.clear();
  }
  worker_done_.store(true);
}

void ExperimentRuntime::run_job(const ExperimentJob& job) {
  using jsonlite::Value;

  const std::uint64_t started_at = unix_now_ms();
  if (!store_.mark_running(job.run_id, started_at)) {
    RuntimeEvent warn;
    warn.kind = RuntimeEventKind::integration_warning;
    warn.run_id = job.run_id;
    warn.error_code = to_string(ErrorCode::db_error);
    warn.detail = "mark_running";
    emit(std::move(warn));
  }
  {
    RuntimeEvent ev;
    ev.kind = RuntimeEventKind::started;
    ev.run_id = job.run_id;
    ev.profile_id = job.profile_id;
    ev.status = to_string(ExperimentStatus::running);
    emit(std::move(ev));
  }

  const ArtifactPaths files = artifact_paths(job.artifact_dir);
  const EnvMap env = build_experiment_env(job.env_allowlist);
  const std::string env_fp = fingerprint_env(env);

  PtySpec spec;
  spec.invocation = build_shell_invocation(job.command, files.stdout_raw, files.stderr_raw);
  spec.cwd = job.cwd;
  spec.env = env;
  spec.timeout_ms = job.timeout_ms;
  spec.kill_grace_ms = options_.kill_grace_ms;

  auto abandon = [&](const std::string& detail) {
    RuntimeEvent ev;
    ev.kind = RuntimeEventKind::abandoned;
    ev.run_id = job.run_id;
    ev.profile_id = job.profile_id;
    ev.detail = detail;
    emit(std::move(ev));
  };

  {
    std::lock_guard<std::mutex> lk(mu_);
    if (stopping_) {
      abandon("shutdown before spawn");
      return;
    }
  }

  const PtyRunResult run =
      run_in_pty(spec, [this](ProcessId pid) { kill_tree(pid); }, &current_pid_);

  {
    std::lock_guard<std::mutex> lk(mu_);
    if (stopping_) {
      abandon("shutdown during run");
      return;
    }
  }

  std::string annotation;
  if (run.timed_out) {
    append_annotation(annotation, "Timed out after " + std::to_string(job.timeout_ms) + "ms");
  }
  append_annotation(annotation, run.error_message);

  const RedactionResult out_red =
      apply_redaction(read_text_file_safe(files.stdout_raw), job.redaction_rules);
  const RedactionResult err_red =
      apply_redaction(read_text_file_safe(files.stderr_raw), job.redaction_rules);
  const TruncateResult out_cap = truncate_bytes(out_red.text, job.output_cap_bytes);
  const TruncateResult err_cap = truncate_bytes(err_red.text, job.output_cap_bytes);
  const bool truncated = out_cap.truncated || err_cap.truncated;
  const bool redacted = out_red.redacted || err_red.redacted;
  const std::string stdout_hash = blake3_hex(out_cap.text);
  const std::string stderr_hash = blake3_hex(err_cap.text);
  const GitFingerprint git = git_fingerprint(job.cwd);

  const std::uint64_t run_started = run.started_at_ms ? run.started_at_ms : started_at;
  const std::uint64_t completed_at = run.completed_at_ms ? run.completed_at_ms : unix_now_ms();
  const std::uint64_t duration = completed_at > run_started ? completed_at - run_started : 0;
  const ExperimentStatus phase = derive_phase_status(run.timed_out, run.exit_code);

  if (!atomic_write(files.stdout_log, out_cap.text) ||
      !atomic_write(files.stderr_log, err_cap.text)) {
    append_annotation(annotation, "artifact_write_failed:logs");
  }

  CompletedRun done;
  done.run_id = job.run_id;
  done.claim_id = job.claim_id;
  done.profile_id = job.profile_id;
  done.command_preview = job.command;
  done.requested_by = job.requested_by;
  done.guard = job.guard;
  done.session = job.session;
  done.phase_status = phase;
  done.exit_code = run.exit_code;
  done.timed_out = run.timed_out;
  done.duration_ms = duration;
  done.completed_at_ms = completed_at;
  done.files = files;
  done.stdout_bytes = out_cap.bytes;
  done.stderr_bytes = err_cap.bytes;
  done.truncated = truncated;
  done.redacted = redacted;
  done.stdout_hash = stdout_hash;
  done.stderr_hash = stderr_hash;
  done.git = git;
  done.trace_id = job.trace_id;
  done.parent_event_id = job.parent_event_id;

  const LedgerOutcome ledger = append_completed_event(
      options_.ledger_factory, config_.ledger_path, config_.ledger_enabled, done);
  std::string evidence_ref;
  if (ledger.ok) {
    evidence_ref = ledger.event_id;
  } else {
    append_annotation(annotation, "ledger_event_failed:" + ledger.reason);
    RuntimeEvent warn;
    warn.kind = RuntimeEventKind::integration_warning;
    warn.run_id = job.run_id;
    warn.error_code = to_string(ErrorCode::ledger_unavailable);
    warn.detail = ledger.reason;
    emit(std::move(warn));
  }

  ExperimentStatus final_status = phase;
  std::optional<ClaimLinkOutcome> link;
  if (!job.claim_id.empty()) {
    if (!evidence_ref.empty() && claims_) {
      link = link_evidence_to_claim(*claims_, job.claim_id, evidence_ref,
                                    derive_evidence_relation(phase, job.relation), phase,
                                    job.requested_by, completed_at);
      for (const auto& a : link->annotations) append_annotation(annotation, a);
      final_status = link->attached ? ExperimentStatus::attached : ExperimentStatus::attach_pending;
    } else {
      final_status = ExperimentStatus::attach_pending;
    }
  }

  jsonlite::Object meta;
  meta["meta_version"] = Value{static_cast<std::uint64_t>(version::ARTIFACT_META_VERSION)};
  meta["runId"] = Value{job.run_id};
  meta["profileId"] = Value{job.profile_id};
  meta["commandPreview"] = Value{job.command};
  meta["requestedBy"] = Value{job.requested_by};
  meta["claimId"] = jsonlite::str_or_null(job.claim_id);
  meta["relation"] = relation_or_null(job.relation);
  meta["guardContext"] = guard_to_value(job.guard);
  meta["cwd"] = Value{job.cwd};
  meta["git"] = git_to_json(git);
  meta["envFingerprint"] = Value{env_fp};
  meta["timeoutMs"] = Value{job.timeout_ms};
  meta["outputCapBytes"] = Value{job.output_cap_bytes};
  meta["startedAt"] = Value{run_started};
  meta["completedAt"] = Value{completed_at};
  meta["durationMs"] = Value{duration};
  meta["exitCode"] = run.exit_code ? jsonlite::int_value(*run.exit_code) : Value{nullptr};
  meta["timedOut"] = Value{run.timed_out};
  meta["redactionRules"] = redaction_rules_to_json(job.redaction_rules);
  meta["error"] = jsonlite::str_or_null(annotation);
  {
    jsonlite::Object output;
    output["stdoutBytes"] = Value{out_cap.bytes};
    output["stderrBytes"] = Value{err_cap.bytes};
    output["truncated"] = Value{truncated};
    output["redacted"] = Value{redacted};
    meta["output"] = Value{std::move(output)};

    jsonlite::Object hashes;
    hashes["stdout"] = Value{stdout_hash};
    hashes["stderr"] = Value{stderr_hash};
    meta["hashes"] = Value{std::move(hashes)};

    jsonlite::Object artifacts;
    artifacts["stdout"] = Value{files.stdout_log};
    artifacts["stderr"] = Value{files.stderr_log};
    meta["artifacts"] = Value{std::move(artifacts)};
  }
  if (job.claim_id.empty()) {
    if (ledger.ok) meta["evidenceEventId"] = Value{evidence_ref};
  } else {
    jsonlite::Object attach;
    attach["evidenceEventId"] = jsonlite::str_or_null(evidence_ref);
    attach["status"] = Value{to_string(final_status)};
    attach["relation"] = link && link->attached ? Value{to_string(link->relation)} : Value{nullptr};
    attach["claimStatusUpdate"] =
        claim_status_update_to_json(link ? link->status_update : std::nullopt);
    meta["attach"] = Value{std::move(attach)};
  }

  jsonlite::Object result = meta;
  result["ok"] = Value{true};
  if (!atomic_write(files.meta, jsonlite::to_json(meta) + "\n") ||
      !atomic_write(files.result, jsonlite::to_json(result) + "\n")) {
    append_annotation(annotation, "artifact_write_failed:meta");
  }
  {
    std::lock_guard<std::mutex> lk(mu_);
    meta_cache_[job.run_id] = meta;
  }

  CompletionUpdate update;
  update.status = final_status;
  update.exit_code = run.exit_code;
  update.duration_ms = duration;
  update.stdout_hash = stdout_hash;
  update.stderr_hash = stderr_hash;
  update.git_sha = git.sha.value_or("");
  update.evidence_ref = evidence_ref;
  if (link && link->attached) update.relation = link->relation;
  update.completed_at_ms = completed_at;
  update.stdout_bytes = out_cap.bytes;
  update.stderr_bytes = err_cap.bytes;
  update.truncated = truncated;
  update.redacted = redacted;
  update.error_message = annotation;
  // Raw files go before the row turns terminal; readers treat a terminal
  // row as a finished artifact directory.
  remove_raw_files(files);
  if (!store_.finalize(job.run_id, update)) {
    RuntimeEvent warn;
    warn.kind = RuntimeEventKind::worker_error;
    warn.run_id = job.run_id;
    warn.error_code = to_string(ErrorCode::db_error);
    warn.detail = "finalize";
    emit(std::move(warn));
  }

  RuntimeEvent ev;
  ev.kind = RuntimeEventKind::completed;
  ev.run_id = job.run_id;
  ev.profile_id = job.profile_id;
  ev.status = to_string(phase);
  ev.detail = annotation;
  ev.has_exit_code = run.exit_code.has_value();
  ev.exit_code = run.exit_code.value_or(0);
  ev.duration_ms = duration;
  emit(std::move(ev));
}

std::optional<jsonlite::Object> ExperimentRuntime::load_meta(const std::string& run_id,
                                                             const std::string& artifact_dir) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = meta_cache_.find(run_id);
    if (it != meta_cache_.end()) return it->second;
  }
  const ArtifactPaths files = artifact_paths(artifact_dir);
  std::error_code ec;
  if (!fs::exists(files.meta, ec)) return std::nullopt;
  std::optional<jsonlite::JsonError> err;
  jsonlite::Object meta = jsonlite::parse(read_text_file_safe(files.meta), &err);
  if (err) return std::nullopt;
  std::lock_guard<std::mutex> lk(mu_);
  meta_cache_[run_id] = meta;
  return meta;
}

GetResult ExperimentRuntime::get(const std::string& run_id) {
  GetResult out;
  if (run_id.empty()) {
    out.error = ErrorCode::run_id_required;
    return out;
  }
  if (!available_.load()) {
    out.error = ErrorCode::unavailable;
    return out;
  }
  auto rec = store_.get(run_id);
  if (!rec) {
    out.error = ErrorCode::experiment_not_found;
    return out;
  }
  if (rec->artifact_dir.empty()) {
    rec->artifact_dir = (fs::path(config_.artifact_root) / run_id).string();
  }

  const auto meta = load_meta(run_id, rec->artifact_dir);
  out.ok = true;
  out.cwd = rec->cwd;
  out.error_message = rec->error_message;
  if (meta) {
    out.git = git_from_json(jsonlite::get_object(*meta, "git"));
    if (out.cwd.empty()) out.cwd = jsonlite::get_string(*meta, "cwd");
    if (out.error_message.empty()) out.error_message = jsonlite::get_string(*meta, "error");
  }
  if (!rec->git_sha.empty()) out.git.sha = rec->git_sha;
  out.record = std::move(*rec);
  return out;
}

ListResult ExperimentRuntime::list(const ListFilters& filters) {
  ListResult out;
  if (!available_.load()) {
    out.error = ErrorCode::unavailable;
    return out;
  }
  ListPage page = store_.list(filters);
  if (!page.ok) {
    out.error = page.error == ErrorCode::none ? ErrorCode::db_error : page.error;
    return out;
  }
  out.ok = true;
  out.experiments = std::move(page.rows);
  out.next_cursor = std::move(page.next_cursor);
  return out;
}

AttachResult ExperimentRuntime::attach_to_claim(const AttachRequest& request) {
  AttachResult out;
  out.run_id = request.run_id;
  out.claim_id = request.claim_id;
  if (request.run_id.empty() || request.claim_id.empty() || request.relation.empty()) {
    out.error = ErrorCode::run_id_claim_id_relation_required;
    return out;
  }
  const auto relation = parse_evidence_relation(lower_trim(request.relation));
  if (!relation) {
    out.error = ErrorCode::invalid_relation;
    return out;
  }
  out.relation = *relation;
  if (!available_.load() || !claims_) {
    out.error = ErrorCode::unavailable;
    return out;
  }

  const auto rec = store_.get(request.run_id);
  if (!rec) {
    out.error = ErrorCode::experiment_not_found;
    return out;
  }
  if (rec->status == ExperimentStatus::attached) {
    out.ok = true;
    out.status = "duplicate";
    out.evidence_event_id = rec->evidence_ref;
    if (!rec->claim_id.empty()) out.claim_id = rec->claim_id;
    out.relation = rec->relation.value_or(*relation);
    return out;
  }
  if (rec->evidence_ref.empty()) {
    out.error = ErrorCode::evidence_event_missing;
    return out;
  }

  const std::uint64_t now = unix_now_ms();
  const std::string actor = request.added_by.empty() ? std::string("system") : request.added_by;
  ClaimLinkOutcome link = link_evidence_to_claim(*claims_, request.claim_id, rec->evidence_ref,
                                                 *relation, phase_of_record(*rec), actor, now);
  if (!link.attached) {
    out.error = link.evidence_reason == to_string(ErrorCode::claim_not_found)
                    ? ErrorCode::claim_not_found
                    : ErrorCode::db_error;
    out.reason = link.evidence_reason;
    return out;
  }
  if (!store_.mark_attached(request.run_id, *relation, request.claim_id, now)) {
    out.error = ErrorCode::db_error;
    out.reason = db_.last_error();
    return out;
  }
  {
    std::lock_guard<std::mutex> lk(mu_);
    meta_cache_.erase(request.run_id);
  }

  out.ok = true;
  out.status = link.evidence_status == "duplicate" ? "duplicate" : "attached";
  out.evidence_event_id = rec->evidence_ref;
  out.claim_status_update = std::move(link.status_update);
  return out;
}

std::optional<ExperimentRecord> ExperimentRuntime::wait_for_terminal(const std::string& run_id,
                                                                     std::uint64_t timeout_ms) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  std::optional<ExperimentRecord> last;
  while (true) {
    if (!available_.load()) return last;
    last = store_.get(run_id);
    if (last && last->status != ExperimentStatus::queued &&
        last->status != ExperimentStatus::running) {
      return last;
    }
    if (std::chrono::steady_clock::now() >= deadline) return last;
    std::this_thread::sleep_for(std::chrono::milliseconds(kWaitPollMs));
  }
}

}  // namespace assay
