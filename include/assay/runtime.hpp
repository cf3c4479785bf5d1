#pragma once

// assay/runtime.hpp — The experiment runtime: queue, worker and operations.
//
// LIFECYCLE:
//   ExperimentRuntime rt(config, options);
//   rt.open();            // store -> claims -> profiles -> artifact root -> worker
//   rt.create(request);   // returns immediately; execution is on the worker
//   rt.close();           // kills the active run, drops the queue, joins
//
// CONCURRENCY:
//   - Exactly one worker thread per open runtime. It pops a job only when no
//     run is current, so at most one pseudo-terminal exists at any instant.
//   - create() is serialised by submit_mu_; the queue, the current slot and
//     the meta cache are guarded by mu_. Store methods take the database
//     mutex themselves and are never called with mu_ held.
//   - Jobs run strictly in FIFO submission order.
//
// FAILURE MODEL:
//   Public operations never throw; they return typed results carrying an
//   ErrorCode. Everything that goes wrong after a job has been accepted is
//   recorded on the row (terminal status + "; "-joined error annotation) and
//   emitted as a RuntimeEvent. An exception escaping a job is caught at the
//   worker loop boundary and logged as worker_error; the loop continues.
//
// SHUTDOWN:
//   close() does not rewrite rows. A row that was `running` when the process
//   died stays `running`; health() reports how many there are.

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "assay/claims.hpp"
#include "assay/config.hpp"
#include "assay/evidence_ledger.hpp"
#include "assay/jsonlite.hpp"
#include "assay/observability.hpp"
#include "assay/profiles.hpp"
#include "assay/sandbox.hpp"
#include "assay/store.hpp"
#include "assay/types.hpp"

namespace assay {

// Collaborators and test seams. Every member has a working default.
struct RuntimeOptions {
  KillProcessTreeFn kill_process_tree;     // default: assay::kill_process_tree
  LedgerFactory ledger_factory;            // default: NdjsonEvidenceLedger
  IClaimsCollaborator* claims{nullptr};    // default: SqliteClaimStore on the runtime db
  ProfileMap default_profiles;             // written on first run; empty = built-ins
  std::uint64_t kill_grace_ms{5000};
};

enum class CreateOutcome {
  started,    // accepted and the worker was idle
  queued,     // accepted behind an in-flight run
  duplicate,  // idempotency key already known
  rejected,
};

std::string to_string(CreateOutcome outcome);

struct CreateResult {
  bool ok{false};
  CreateOutcome outcome{CreateOutcome::rejected};
  ErrorCode error{ErrorCode::none};
  std::string param;   // offending parameter for invalid_or_missing_param
  std::string run_id;
  ExperimentStatus status{ExperimentStatus::queued};
  bool queued{false};
  std::string artifact_dir;
  std::string detail;

  std::string to_json() const;
};

// Full view of one run: the durable row merged with meta.json.
struct GetResult {
  bool ok{false};
  ErrorCode error{ErrorCode::none};
  ExperimentRecord record;
  GitFingerprint git;
  std::string cwd;
  std::string error_message;

  std::string to_json() const;
};

struct ListResult {
  bool ok{false};
  ErrorCode error{ErrorCode::none};
  std::vector<ExperimentRecord> experiments;
  std::string next_cursor;

  std::string to_json() const;
};

struct AttachRequest {
  std::string run_id;
  std::string claim_id;
  std::string relation;
  std::string added_by{"system"};
};

struct AttachResult {
  bool ok{false};
  ErrorCode error{ErrorCode::none};
  std::string reason;  // collaborator reason when evidence could not be added
  std::string run_id;
  std::string claim_id;
  EvidenceRelation relation{EvidenceRelation::supports};
  std::string status;  // attached | duplicate
  std::string evidence_event_id;
  std::optional<ClaimStatusUpdate> claim_status_update;

  std::string to_json() const;
};

struct HealthStatus {
  bool ok{false};
  bool available{false};
  bool running{false};
  std::string current_run_id;
  std::size_t queued{0};
  std::size_t queue_capacity{0};
  std::size_t profile_count{0};
  std::uint64_t stale_running{0};
  std::string db_path;
  std::string artifact_root;
  std::string profiles_path;
  std::string ledger_path;
  bool ledger_enabled{false};
  std::string stats_json;

  std::string to_json() const;
};

// Summary rendering shared by list() and the full view.
jsonlite::Object experiment_summary_json(const ExperimentRecord& record);

class ExperimentRuntime {
 public:
  explicit ExperimentRuntime(RuntimeConfig config, RuntimeOptions options = {});
  ~ExperimentRuntime();
  ExperimentRuntime(const ExperimentRuntime&) = delete;
  ExperimentRuntime& operator=(const ExperimentRuntime&) = delete;

  InitResult open();
  void close();
  bool is_available() const { return available_.load(); }

  HealthStatus health();
  CreateResult create(const ExperimentRequest& request);
  GetResult get(const std::string& run_id);
  ListResult list(const ListFilters& filters);
  AttachResult attach_to_claim(const AttachRequest& request);

  // Polls the store until the run leaves queued/running or `timeout_ms`
  // elapses. Returns the last observed row.
  std::optional<ExperimentRecord> wait_for_terminal(const std::string& run_id,
                                                    std::uint64_t timeout_ms);

  const RuntimeConfig& config() const { return config_; }
  const ProfileMap& profiles() const { return profiles_; }
  const std::vector<std::string>& profile_ids() const { return profile_ids_; }
  RuntimeStats& stats() { return stats_; }
  Database& database() { return db_; }
  // Null unless the runtime owns its reference claims store.
  SqliteClaimStore* claim_store() { return owned_claims_.get(); }

 private:
  void worker_loop();
  void run_job(const ExperimentJob& job);
  // Counts the kill and forwards to the injected KillProcessTreeFn.
  void kill_tree(ProcessId pid);
  void emit(RuntimeEvent ev);
  std::optional<jsonlite::Object> load_meta(const std::string& run_id,
                                            const std::string& artifact_dir);

  RuntimeConfig config_;
  RuntimeOptions options_;
  IClaimsCollaborator* claims_{nullptr};
  std::unique_ptr<SqliteClaimStore> owned_claims_;

  Database db_;
  ExperimentStore store_{db_};
  ProfileMap profiles_;
  std::vector<std::string> profile_ids_;

  RuntimeStats stats_;
  EventSink sink_;

  std::atomic<bool> available_{false};
  std::atomic<ProcessId> current_pid_{0};
  std::atomic<bool> worker_done_{true};

  std::mutex submit_mu_;
  std::mutex mu_;
  std::condition_variable cv_;
  std::deque<ExperimentJob> queue_;
  std::string current_run_id_;
  bool stopping_{false};
  std::thread worker_;
  std::map<std::string, jsonlite::Object> meta_cache_;
};

}  // namespace assay
