#include "assay/store.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>

#include "assay/jsonlite.hpp"
#include "assay/version.hpp"

namespace fs = std::filesystem;

namespace assay {

// ---------------------------------------------------------------------------
// Statement
// ---------------------------------------------------------------------------

Statement::Statement(sqlite3* db, const std::string& sql) {
  if (!db) return;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
    std::cerr << "{\"event\":\"store.prepare_failed\",\"error\":\""
              << jsonlite::escape(sqlite3_errmsg(db)) << "\"}\n";
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

Statement::~Statement() {
  if (stmt_) sqlite3_finalize(stmt_);
}

void Statement::bind_text(int idx, const std::string& value) {
  if (stmt_) sqlite3_bind_text(stmt_, idx, value.c_str(), -1, SQLITE_TRANSIENT);
}

void Statement::bind_text_or_null(int idx, const std::string& value) {
  if (value.empty()) {
    bind_null(idx);
  } else {
    bind_text(idx, value);
  }
}

void Statement::bind_int64(int idx, std::int64_t value) {
  if (stmt_) sqlite3_bind_int64(stmt_, idx, value);
}

void Statement::bind_u64_or_null(int idx, const std::optional<std::uint64_t>& value) {
  if (value) {
    bind_int64(idx, static_cast<std::int64_t>(*value));
  } else {
    bind_null(idx);
  }
}

void Statement::bind_null(int idx) {
  if (stmt_) sqlite3_bind_null(stmt_, idx);
}

bool Statement::step_row() { return stmt_ && sqlite3_step(stmt_) == SQLITE_ROW; }

bool Statement::step_done() { return stmt_ && sqlite3_step(stmt_) == SQLITE_DONE; }

bool Statement::column_is_null(int col) const {
  return !stmt_ || sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

std::string Statement::column_text(int col) const {
  if (column_is_null(col)) return {};
  const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
  return text ? std::string(text) : std::string();
}

std::int64_t Statement::column_int64(int col) const {
  return stmt_ ? sqlite3_column_int64(stmt_, col) : 0;
}

std::optional<std::uint64_t> Statement::column_u64_opt(int col) const {
  if (column_is_null(col)) return std::nullopt;
  const std::int64_t v = sqlite3_column_int64(stmt_, col);
  return v < 0 ? 0 : static_cast<std::uint64_t>(v);
}

// ---------------------------------------------------------------------------
// Database
// ---------------------------------------------------------------------------

namespace {

constexpr const char* kSchemaV1 =
    "CREATE TABLE IF NOT EXISTS schema_migrations ("
    "  version INTEGER PRIMARY KEY,"
    "  applied_at INTEGER NOT NULL"
    ");"
    "CREATE TABLE IF NOT EXISTS claims ("
    "  id TEXT PRIMARY KEY,"
    "  statement TEXT NOT NULL,"
    "  owner TEXT NOT NULL,"
    "  status TEXT NOT NULL DEFAULT 'proposed' CHECK (status IN "
    "    ('proposed','contested','pending_proof','confirmed','deprecated')),"
    "  created_at INTEGER NOT NULL,"
    "  updated_at INTEGER NOT NULL"
    ");"
    "CREATE TABLE IF NOT EXISTS claim_evidence ("
    "  claim_id TEXT NOT NULL REFERENCES claims(id),"
    "  evidence_ref TEXT NOT NULL,"
    "  added_by TEXT NOT NULL,"
    "  relation TEXT NOT NULL DEFAULT 'supports' CHECK (relation IN "
    "    ('supports','contradicts','caused_by')),"
    "  created_at INTEGER NOT NULL,"
    "  PRIMARY KEY (claim_id, evidence_ref)"
    ");"
    "CREATE TABLE IF NOT EXISTS claim_status_history ("
    "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  claim_id TEXT NOT NULL REFERENCES claims(id),"
    "  old_status TEXT,"
    "  new_status TEXT NOT NULL,"
    "  changed_by TEXT NOT NULL,"
    "  reason TEXT,"
    "  changed_at INTEGER NOT NULL"
    ");"
    "CREATE INDEX IF NOT EXISTS idx_claim_history_claim ON claim_status_history(claim_id);"
    "CREATE TABLE IF NOT EXISTS experiments ("
    "  id TEXT PRIMARY KEY,"
    "  idempotency_key TEXT,"
    "  claim_id TEXT,"
    "  profile TEXT NOT NULL,"
    "  command TEXT NOT NULL,"
    "  requested_by TEXT NOT NULL,"
    "  relation TEXT CHECK (relation IN ('supports','contradicts','caused_by')),"
    "  guard_context TEXT,"
    "  status TEXT NOT NULL DEFAULT 'queued' CHECK (status IN ('queued','running',"
    "    'succeeded','failed','timed_out','canceled','attach_pending','attached')),"
    "  exit_code INTEGER,"
    "  duration_ms INTEGER,"
    "  stdout_hash TEXT,"
    "  stderr_hash TEXT,"
    "  git_sha TEXT,"
    "  evidence_ref TEXT,"
    "  session TEXT,"
    "  timeout_ms INTEGER,"
    "  output_cap_bytes INTEGER,"
    "  artifact_dir TEXT,"
    "  cwd TEXT,"
    "  stdout_bytes INTEGER NOT NULL DEFAULT 0,"
    "  stderr_bytes INTEGER NOT NULL DEFAULT 0,"
    "  truncated INTEGER NOT NULL DEFAULT 0 CHECK (truncated IN (0, 1)),"
    "  redacted INTEGER NOT NULL DEFAULT 0 CHECK (redacted IN (0, 1)),"
    "  error_message TEXT,"
    "  created_at INTEGER NOT NULL,"
    "  updated_at INTEGER,"
    "  started_at INTEGER,"
    "  completed_at INTEGER"
    ");"
    "CREATE UNIQUE INDEX IF NOT EXISTS idx_experiments_idempotency"
    "  ON experiments(idempotency_key) WHERE idempotency_key IS NOT NULL;"
    "CREATE INDEX IF NOT EXISTS idx_experiments_claim ON experiments(claim_id);"
    "CREATE INDEX IF NOT EXISTS idx_experiments_status ON experiments(status);"
    "CREATE INDEX IF NOT EXISTS idx_experiments_session ON experiments(session);"
    "CREATE INDEX IF NOT EXISTS idx_experiments_created ON experiments(created_at DESC);";

}  // namespace

Database::~Database() { close(); }

InitResult Database::open(const std::string& path, std::uint64_t now_ms) {
  InitResult result;
  close();
  path_ = path;

  std::error_code ec;
  const fs::path target(path);
  if (target.has_parent_path()) fs::create_directories(target.parent_path(), ec);

  if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
    result.error = ErrorCode::db_init_failed;
    result.reason = db_ ? sqlite3_errmsg(db_) : "sqlite3_open failed";
    close();
    return result;
  }

  exec("PRAGMA journal_mode=WAL");
  exec("PRAGMA synchronous=NORMAL");
  exec("PRAGMA busy_timeout=5000");

  std::string reason;
  if (!migrate(now_ms, &reason)) {
    result.error = ErrorCode::db_init_failed;
    result.reason = reason;
    close();
    return result;
  }
  result.ok = true;
  return result;
}

bool Database::migrate(std::uint64_t now_ms, std::string* reason) {
  std::uint32_t found = 0;
  {
    Statement st(db_, "PRAGMA user_version");
    if (st.step_row()) found = static_cast<std::uint32_t>(st.column_int64(0));
  }
  const auto compat = version::check_store_schema(found);
  if (!compat.ok) {
    *reason = compat.error_code + ": " + compat.description;
    return false;
  }
  if (found == version::STORE_SCHEMA_VERSION) return true;

  if (!exec("BEGIN") || !exec(kSchemaV1)) {
    *reason = last_error();
    exec("ROLLBACK");
    return false;
  }
  Statement mark(db_, "INSERT OR IGNORE INTO schema_migrations(version, applied_at) VALUES (?, ?)");
  mark.bind_int64(1, version::STORE_SCHEMA_VERSION);
  mark.bind_int64(2, static_cast<std::int64_t>(now_ms));
  if (!mark.step_done() ||
      !exec("PRAGMA user_version=" + std::to_string(version::STORE_SCHEMA_VERSION)) ||
      !exec("COMMIT")) {
    *reason = last_error();
    exec("ROLLBACK");
    return false;
  }
  return true;
}

void Database::close() {
  if (db_) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

bool Database::exec(const std::string& sql) {
  if (!db_) return false;
  char* err_msg = nullptr;
  const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::cerr << "{\"event\":\"store.sql_error\",\"error\":\""
              << jsonlite::escape(err_msg ? err_msg : "unknown") << "\"}\n";
    if (err_msg) sqlite3_free(err_msg);
    return false;
  }
  return true;
}

std::string Database::last_error() const {
  return db_ ? std::string(sqlite3_errmsg(db_)) : std::string("database closed");
}

int Database::changes() const { return db_ ? sqlite3_changes(db_) : 0; }

// ---------------------------------------------------------------------------
// ExperimentStore
// ---------------------------------------------------------------------------

namespace {

constexpr const char* kSelectColumns =
    "SELECT id, idempotency_key, claim_id, profile, command, requested_by, relation,"
    " guard_context, status, exit_code, duration_ms, stdout_hash, stderr_hash, git_sha,"
    " evidence_ref, session, timeout_ms, output_cap_bytes, artifact_dir, cwd,"
    " stdout_bytes, stderr_bytes, truncated, redacted, error_message, created_at,"
    " updated_at, started_at, completed_at FROM experiments";

ExperimentRecord read_row(const Statement& st) {
  ExperimentRecord r;
  r.id = st.column_text(0);
  r.idempotency_key = st.column_text(1);
  r.claim_id = st.column_text(2);
  r.profile_id = st.column_text(3);
  r.command = st.column_text(4);
  r.requested_by = st.column_text(5);
  r.relation = parse_evidence_relation(st.column_text(6));
  r.guard = guard_from_json(st.column_text(7));
  r.status = parse_experiment_status(st.column_text(8)).value_or(ExperimentStatus::queued);
  if (!st.column_is_null(9)) r.exit_code = static_cast<int>(st.column_int64(9));
  r.duration_ms = st.column_u64_opt(10);
  r.stdout_hash = st.column_text(11);
  r.stderr_hash = st.column_text(12);
  r.git_sha = st.column_text(13);
  r.evidence_ref = st.column_text(14);
  r.session = st.column_text(15);
  r.timeout_ms = st.column_u64_opt(16).value_or(0);
  r.output_cap_bytes = st.column_u64_opt(17).value_or(0);
  r.artifact_dir = st.column_text(18);
  r.cwd = st.column_text(19);
  r.stdout_bytes = st.column_u64_opt(20).value_or(0);
  r.stderr_bytes = st.column_u64_opt(21).value_or(0);
  r.truncated = st.column_int64(22) != 0;
  r.redacted = st.column_int64(23) != 0;
  r.error_message = st.column_text(24);
  r.created_at_ms = st.column_u64_opt(25).value_or(0);
  r.updated_at_ms = st.column_u64_opt(26);
  r.started_at_ms = st.column_u64_opt(27);
  r.completed_at_ms = st.column_u64_opt(28);
  return r;
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

}  // namespace

bool ExperimentStore::insert(const ExperimentRecord& r) {
  std::lock_guard<std::mutex> lk(db_.mutex());
  Statement st(db_.handle(),
               "INSERT INTO experiments (id, idempotency_key, claim_id, profile, command,"
               " requested_by, relation, guard_context, status, session, timeout_ms,"
               " output_cap_bytes, artifact_dir, cwd, created_at, updated_at)"
               " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
  st.bind_text(1, r.id);
  st.bind_text_or_null(2, r.idempotency_key);
  st.bind_text_or_null(3, r.claim_id);
  st.bind_text(4, r.profile_id);
  st.bind_text(5, r.command);
  st.bind_text(6, r.requested_by);
  st.bind_text_or_null(7, r.relation ? to_string(*r.relation) : std::string());
  st.bind_text_or_null(8, r.guard ? guard_to_json(*r.guard) : std::string());
  st.bind_text(9, to_string(r.status));
  st.bind_text_or_null(10, r.session);
  st.bind_int64(11, static_cast<std::int64_t>(r.timeout_ms));
  st.bind_int64(12, static_cast<std::int64_t>(r.output_cap_bytes));
  st.bind_text(13, r.artifact_dir);
  st.bind_text(14, r.cwd);
  st.bind_int64(15, static_cast<std::int64_t>(r.created_at_ms));
  st.bind_int64(16, static_cast<std::int64_t>(r.created_at_ms));
  return st.step_done();
}

std::optional<ExperimentRecord> ExperimentStore::find_by_idempotency_key(const std::string& key) {
  if (key.empty()) return std::nullopt;
  std::lock_guard<std::mutex> lk(db_.mutex());
  Statement st(db_.handle(), std::string(kSelectColumns) + " WHERE idempotency_key = ? LIMIT 1");
  st.bind_text(1, key);
  if (!st.step_row()) return std::nullopt;
  return read_row(st);
}

std::optional<ExperimentRecord> ExperimentStore::get(const std::string& run_id) {
  std::lock_guard<std::mutex> lk(db_.mutex());
  Statement st(db_.handle(), std::string(kSelectColumns) + " WHERE id = ? LIMIT 1");
  st.bind_text(1, run_id);
  if (!st.step_row()) return std::nullopt;
  return read_row(st);
}

bool ExperimentStore::mark_running(const std::string& run_id, std::uint64_t started_at_ms) {
  std::lock_guard<std::mutex> lk(db_.mutex());
  Statement st(db_.handle(),
               "UPDATE experiments SET status = 'running', started_at = ?, updated_at = ?"
               " WHERE id = ?");
  st.bind_int64(1, static_cast<std::int64_t>(started_at_ms));
  st.bind_int64(2, static_cast<std::int64_t>(started_at_ms));
  st.bind_text(3, run_id);
  return st.step_done();
}

bool ExperimentStore::finalize(const std::string& run_id, const CompletionUpdate& u) {
  std::lock_guard<std::mutex> lk(db_.mutex());
  Statement st(db_.handle(),
               "UPDATE experiments SET status = ?, exit_code = ?, duration_ms = ?,"
               " stdout_hash = ?, stderr_hash = ?, git_sha = ?, evidence_ref = ?,"
               " relation = COALESCE(?, relation), completed_at = ?, updated_at = ?,"
               " stdout_bytes = ?, stderr_bytes = ?, truncated = ?, redacted = ?,"
               " error_message = ? WHERE id = ?");
  st.bind_text(1, to_string(u.status));
  if (u.exit_code) {
    st.bind_int64(2, *u.exit_code);
  } else {
    st.bind_null(2);
  }
  st.bind_int64(3, static_cast<std::int64_t>(u.duration_ms));
  st.bind_text_or_null(4, u.stdout_hash);
  st.bind_text_or_null(5, u.stderr_hash);
  st.bind_text_or_null(6, u.git_sha);
  st.bind_text_or_null(7, u.evidence_ref);
  st.bind_text_or_null(8, u.relation ? to_string(*u.relation) : std::string());
  st.bind_int64(9, static_cast<std::int64_t>(u.completed_at_ms));
  st.bind_int64(10, static_cast<std::int64_t>(u.completed_at_ms));
  st.bind_int64(11, static_cast<std::int64_t>(u.stdout_bytes));
  st.bind_int64(12, static_cast<std::int64_t>(u.stderr_bytes));
  st.bind_int64(13, u.truncated ? 1 : 0);
  st.bind_int64(14, u.redacted ? 1 : 0);
  st.bind_text_or_null(15, u.error_message);
  st.bind_text(16, run_id);
  return st.step_done();
}

bool ExperimentStore::mark_attached(const std::string& run_id, EvidenceRelation relation,
                                    const std::string& claim_id, std::uint64_t now_ms) {
  std::lock_guard<std::mutex> lk(db_.mutex());
  Statement st(db_.handle(),
               "UPDATE experiments SET claim_id = ?, relation = ?, status = 'attached',"
               " updated_at = ? WHERE id = ?");
  st.bind_text(1, claim_id);
  st.bind_text(2, to_string(relation));
  st.bind_int64(3, static_cast<std::int64_t>(now_ms));
  st.bind_text(4, run_id);
  return st.step_done();
}

std::uint64_t ExperimentStore::count_with_status(ExperimentStatus status) {
  std::lock_guard<std::mutex> lk(db_.mutex());
  Statement st(db_.handle(), "SELECT COUNT(*) FROM experiments WHERE status = ?");
  st.bind_text(1, to_string(status));
  if (!st.step_row()) return 0;
  return static_cast<std::uint64_t>(st.column_int64(0));
}

ListPage ExperimentStore::list(const ListFilters& f) {
  ListPage page;
  long long limit = f.limit.value_or(kDefaultListLimit);
  limit = std::clamp(limit, 1LL, kMaxListLimit);

  std::string sql = kSelectColumns;
  std::vector<std::string> clauses;
  // Bind values in clause order; text and integer binds are kept apart.
  struct Bind {
    bool is_int;
    std::string text;
    std::int64_t num;
  };
  std::vector<Bind> binds;

  if (!f.status.empty() && parse_experiment_status(f.status)) {
    clauses.push_back("status = ?");
    binds.push_back({false, f.status, 0});
  }
  if (!f.profile.empty()) {
    clauses.push_back("profile = ?");
    binds.push_back({false, lower(f.profile), 0});
  }
  if (!f.claim.empty()) {
    clauses.push_back("claim_id = ?");
    binds.push_back({false, f.claim, 0});
  }
  if (!f.guard_id.empty()) {
    clauses.push_back("json_extract(guard_context, '$.guardId') = ?");
    binds.push_back({false, f.guard_id, 0});
  }
  if (f.since_ms && *f.since_ms > 0) {
    clauses.push_back("created_at >= ?");
    binds.push_back({true, {}, static_cast<std::int64_t>(*f.since_ms)});
  }
  if (f.until_ms && *f.until_ms > 0) {
    clauses.push_back("created_at <= ?");
    binds.push_back({true, {}, static_cast<std::int64_t>(*f.until_ms)});
  }
  std::uint64_t cursor_at = 0;
  std::string cursor_id;
  if (!f.cursor.empty() && decode_cursor(f.cursor, &cursor_at, &cursor_id)) {
    clauses.push_back("(created_at < ? OR (created_at = ? AND id < ?))");
    binds.push_back({true, {}, static_cast<std::int64_t>(cursor_at)});
    binds.push_back({true, {}, static_cast<std::int64_t>(cursor_at)});
    binds.push_back({false, cursor_id, 0});
  }
  for (size_t i = 0; i < clauses.size(); ++i) {
    sql += (i == 0 ? " WHERE " : " AND ");
    sql += clauses[i];
  }
  sql += " ORDER BY created_at DESC, id DESC LIMIT ?";

  std::lock_guard<std::mutex> lk(db_.mutex());
  Statement st(db_.handle(), sql);
  if (!st.ok()) {
    page.error = ErrorCode::db_error;
    return page;
  }
  int idx = 1;
  for (const auto& b : binds) {
    if (b.is_int) {
      st.bind_int64(idx++, b.num);
    } else {
      st.bind_text(idx++, b.text);
    }
  }
  // One extra row tells us whether another page exists.
  st.bind_int64(idx, limit + 1);
  while (st.step_row()) page.rows.push_back(read_row(st));

  if (static_cast<long long>(page.rows.size()) > limit) {
    page.rows.resize(static_cast<size_t>(limit));
    const auto& last = page.rows.back();
    page.next_cursor = encode_cursor(last.created_at_ms, last.id);
  }
  page.ok = true;
  return page;
}

// ---------------------------------------------------------------------------
// Cursor codec
// ---------------------------------------------------------------------------

namespace {
constexpr char kB64Url[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

int b64url_index(char c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return c - 'a' + 26;
  if (c >= '0' && c <= '9') return c - '0' + 52;
  if (c == '-') return 62;
  if (c == '_') return 63;
  return -1;
}
}  // namespace

std::string base64url_encode(const std::string& bytes) {
  std::string out;
  out.reserve((bytes.size() + 2) / 3 * 4);
  size_t i = 0;
  while (i + 3 <= bytes.size()) {
    const std::uint32_t n = (static_cast<unsigned char>(bytes[i]) << 16) |
                            (static_cast<unsigned char>(bytes[i + 1]) << 8) |
                            static_cast<unsigned char>(bytes[i + 2]);
    out += kB64Url[(n >> 18) & 63];
    out += kB64Url[(n >> 12) & 63];
    out += kB64Url[(n >> 6) & 63];
    out += kB64Url[n & 63];
    i += 3;
  }
  const size_t rest = bytes.size() - i;
  if (rest == 1) {
    const std::uint32_t n = static_cast<unsigned char>(bytes[i]) << 16;
    out += kB64Url[(n >> 18) & 63];
    out += kB64Url[(n >> 12) & 63];
  } else if (rest == 2) {
    const std::uint32_t n = (static_cast<unsigned char>(bytes[i]) << 16) |
                            (static_cast<unsigned char>(bytes[i + 1]) << 8);
    out += kB64Url[(n >> 18) & 63];
    out += kB64Url[(n >> 12) & 63];
    out += kB64Url[(n >> 6) & 63];
  }
  return out;
}

std::optional<std::string> base64url_decode(const std::string& text) {
  std::string in = text;
  while (!in.empty() && in.back() == '=') in.pop_back();
  if (in.size() % 4 == 1) return std::nullopt;
  std::string out;
  std::uint32_t acc = 0;
  int bits = 0;
  for (char c : in) {
    const int v = b64url_index(c);
    if (v < 0) return std::nullopt;
    acc = (acc << 6) | static_cast<std::uint32_t>(v);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out += static_cast<char>((acc >> bits) & 0xFF);
    }
  }
  return out;
}

std::string encode_cursor(std::uint64_t created_at_ms, const std::string& id) {
  jsonlite::Object o;
  o["createdAt"] = jsonlite::Value{created_at_ms};
  o["id"] = jsonlite::Value{id};
  return base64url_encode(jsonlite::to_json(o));
}

bool decode_cursor(const std::string& cursor, std::uint64_t* created_at_ms, std::string* id) {
  const auto raw = base64url_decode(cursor);
  if (!raw) return false;
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object o = jsonlite::parse(*raw, &err);
  if (err) return false;
  auto it = o.find("createdAt");
  if (it == o.end() || !std::holds_alternative<std::uint64_t>(it->second.v)) return false;
  const std::uint64_t at = std::get<std::uint64_t>(it->second.v);
  const std::string cursor_id = jsonlite::get_string(o, "id");
  if (at == 0 || cursor_id.empty()) return false;
  *created_at_ms = at;
  *id = cursor_id;
  return true;
}

}  // namespace assay
