#pragma once

// assay/store.hpp — SQLite persistence for experiment records.
//
// DESIGN:
//   One Database handle is shared by the runtime (caller thread + worker
//   thread) and the reference claims collaborator. Every public store method
//   takes the database mutex for its whole statement sequence, so callers
//   never hold it themselves and methods never nest.
//
// SCHEMA (version::STORE_SCHEMA_VERSION, stamped in PRAGMA user_version):
//   experiments           one row per run, never deleted
//   claims                reference claims collaborator
//   claim_evidence        (claim_id, evidence_ref) primary key
//   claim_status_history  append-only transition log
//   schema_migrations     one row per applied version
//
// INVARIANT:
//   idempotency_key is unique across all non-null values (partial unique
//   index). The runtime relies on the index, not on a prior SELECT, to
//   guarantee at-most-once insertion.

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "assay/types.hpp"

struct sqlite3;
struct sqlite3_stmt;

namespace assay {

// ---------------------------------------------------------------------------
// Statement: RAII prepared statement. Bind indices are 1-based, column
// indices 0-based (SQLite convention).
// ---------------------------------------------------------------------------
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql);
  ~Statement();
  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  bool ok() const { return stmt_ != nullptr; }

  void bind_text(int idx, const std::string& value);
  // Binds NULL for an empty string.
  void bind_text_or_null(int idx, const std::string& value);
  void bind_int64(int idx, std::int64_t value);
  void bind_u64_or_null(int idx, const std::optional<std::uint64_t>& value);
  void bind_null(int idx);

  // Returns true while a row is available.
  bool step_row();
  // Runs a statement that returns no rows. True on SQLITE_DONE.
  bool step_done();

  bool column_is_null(int col) const;
  std::string column_text(int col) const;
  std::int64_t column_int64(int col) const;
  std::optional<std::uint64_t> column_u64_opt(int col) const;

 private:
  sqlite3_stmt* stmt_{nullptr};
};

struct InitResult {
  bool ok{false};
  ErrorCode error{ErrorCode::none};
  std::string reason;
};

class Database {
 public:
  Database() = default;
  ~Database();
  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  // Opens (creating parent directories), applies pragmas and migrates the
  // schema. Failure leaves the handle closed with error = db_init_failed.
  InitResult open(const std::string& path, std::uint64_t now_ms);
  void close();
  bool is_available() const { return db_ != nullptr; }

  sqlite3* handle() { return db_; }
  std::mutex& mutex() { return mu_; }

  // Executes one or more statements. Caller holds mutex() when shared.
  bool exec(const std::string& sql);
  std::string last_error() const;
  // Rows modified by the most recent INSERT/UPDATE/DELETE.
  int changes() const;
  const std::string& path() const { return path_; }

 private:
  bool migrate(std::uint64_t now_ms, std::string* reason);

  sqlite3* db_{nullptr};
  std::string path_;
  std::mutex mu_;
};

// Result columns written once a run reaches a terminal state.
struct CompletionUpdate {
  ExperimentStatus status{ExperimentStatus::failed};
  std::optional<int> exit_code;
  std::uint64_t duration_ms{0};
  std::string stdout_hash;
  std::string stderr_hash;
  std::string git_sha;
  std::string evidence_ref;
  std::optional<EvidenceRelation> relation;  // COALESCEd with the stored value
  std::uint64_t completed_at_ms{0};
  std::uint64_t stdout_bytes{0};
  std::uint64_t stderr_bytes{0};
  bool truncated{false};
  bool redacted{false};
  std::string error_message;
};

constexpr long long kDefaultListLimit = 50;
constexpr long long kMaxListLimit = 500;

struct ListFilters {
  std::string status;    // ignored unless a recognised status
  std::string profile;   // lower-cased before matching
  std::string claim;
  std::string guard_id;
  std::optional<std::uint64_t> since_ms;
  std::optional<std::uint64_t> until_ms;
  std::string cursor;    // opaque; ignored when it fails to decode
  std::optional<long long> limit;
};

struct ListPage {
  bool ok{false};
  ErrorCode error{ErrorCode::none};
  std::vector<ExperimentRecord> rows;
  std::string next_cursor;  // empty when exhausted
};

class ExperimentStore {
 public:
  explicit ExperimentStore(Database& db) : db_(db) {}

  bool insert(const ExperimentRecord& record);
  std::optional<ExperimentRecord> find_by_idempotency_key(const std::string& key);
  std::optional<ExperimentRecord> get(const std::string& run_id);

  bool mark_running(const std::string& run_id, std::uint64_t started_at_ms);
  bool finalize(const std::string& run_id, const CompletionUpdate& update);
  bool mark_attached(const std::string& run_id, EvidenceRelation relation,
                     const std::string& claim_id, std::uint64_t now_ms);

  std::uint64_t count_with_status(ExperimentStatus status);
  ListPage list(const ListFilters& filters);

 private:
  Database& db_;
};

// Keyset cursor: base64url(JSON {"createdAt":<ms>,"id":"<runId>"}).
std::string encode_cursor(std::uint64_t created_at_ms, const std::string& id);
// False unless createdAt is a positive integer and id is non-empty.
bool decode_cursor(const std::string& cursor, std::uint64_t* created_at_ms, std::string* id);

std::string base64url_encode(const std::string& bytes);
std::optional<std::string> base64url_decode(const std::string& text);

}  // namespace assay
