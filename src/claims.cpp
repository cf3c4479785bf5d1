#include "assay/claims.hpp"

#include <mutex>

#include "assay/jsonlite.hpp"
#include "assay/store.hpp"

namespace assay {

bool is_allowed_claim_transition(ClaimStatus from, ClaimStatus to) {
  switch (from) {
    case ClaimStatus::proposed:
      return to == ClaimStatus::confirmed || to == ClaimStatus::contested ||
             to == ClaimStatus::pending_proof || to == ClaimStatus::deprecated;
    case ClaimStatus::pending_proof:
      return to == ClaimStatus::confirmed || to == ClaimStatus::contested ||
             to == ClaimStatus::deprecated;
    case ClaimStatus::contested:
      return to == ClaimStatus::confirmed || to == ClaimStatus::pending_proof ||
             to == ClaimStatus::deprecated;
    case ClaimStatus::confirmed:
      return to == ClaimStatus::contested || to == ClaimStatus::pending_proof ||
             to == ClaimStatus::deprecated;
    case ClaimStatus::deprecated:
      return false;
  }
  return false;
}

SqliteClaimStore::CreateResult SqliteClaimStore::create_claim(const std::string& id,
                                                              const std::string& statement,
                                                              const std::string& owner,
                                                              ClaimStatus status,
                                                              std::uint64_t now_ms) {
  CreateResult r;
  if (statement.empty()) {
    r.reason = "statement_required";
    return r;
  }
  Claim c;
  c.id = id.empty() ? random_id("clm_") : id;
  c.statement = statement;
  c.owner = owner.empty() ? "system" : owner;
  c.status = status;
  c.created_at_ms = now_ms;
  c.updated_at_ms = now_ms;

  std::lock_guard<std::mutex> lk(db_.mutex());
  if (!db_.is_available()) {
    r.reason = to_string(ErrorCode::unavailable);
    return r;
  }
  Statement st(db_.handle(),
               "INSERT INTO claims (id, statement, owner, status, created_at, updated_at)"
               " VALUES (?, ?, ?, ?, ?, ?)");
  st.bind_text(1, c.id);
  st.bind_text(2, c.statement);
  st.bind_text(3, c.owner);
  st.bind_text(4, to_string(c.status));
  st.bind_int64(5, static_cast<std::int64_t>(now_ms));
  st.bind_int64(6, static_cast<std::int64_t>(now_ms));
  if (!st.step_done()) {
    r.reason = db_.last_error();
    return r;
  }
  Statement hist(db_.handle(),
                 "INSERT INTO claim_status_history (claim_id, old_status, new_status, changed_by,"
                 " reason, changed_at) VALUES (?, NULL, ?, ?, 'created', ?)");
  hist.bind_text(1, c.id);
  hist.bind_text(2, to_string(c.status));
  hist.bind_text(3, c.owner);
  hist.bind_int64(4, static_cast<std::int64_t>(now_ms));
  if (!hist.step_done()) {
    r.reason = db_.last_error();
    return r;
  }
  r.ok = true;
  r.claim = std::move(c);
  return r;
}

AddEvidenceResult SqliteClaimStore::add_evidence(const std::string& claim_id,
                                                 const std::string& evidence_ref,
                                                 EvidenceRelation relation,
                                                 const AddEvidenceOptions& opts) {
  AddEvidenceResult r;
  if (claim_id.empty() || evidence_ref.empty()) {
    r.reason = "claim_id_and_evidence_ref_required";
    return r;
  }
  std::lock_guard<std::mutex> lk(db_.mutex());
  if (!db_.is_available()) {
    r.reason = to_string(ErrorCode::unavailable);
    return r;
  }
  if (!get_claim_locked(claim_id)) {
    r.reason = to_string(ErrorCode::claim_not_found);
    return r;
  }
  Statement st(db_.handle(),
               "INSERT OR IGNORE INTO claim_evidence (claim_id, evidence_ref, added_by, relation,"
               " created_at) VALUES (?, ?, ?, ?, ?)");
  st.bind_text(1, claim_id);
  st.bind_text(2, evidence_ref);
  st.bind_text(3, opts.added_by.empty() ? std::string("system") : opts.added_by);
  st.bind_text(4, to_string(relation));
  st.bind_int64(5, static_cast<std::int64_t>(opts.now_ms ? opts.now_ms : unix_now_ms()));
  if (!st.step_done()) {
    r.reason = db_.last_error();
    return r;
  }
  r.ok = true;
  r.status = db_.changes() > 0 ? "inserted" : "duplicate";
  return r;
}

ClaimStatusUpdate SqliteClaimStore::update_claim_status(const std::string& claim_id,
                                                        ClaimStatus new_status,
                                                        const std::string& actor,
                                                        const std::string& reason_code,
                                                        std::uint64_t now_ms) {
  ClaimStatusUpdate r;
  r.status = new_status;
  std::lock_guard<std::mutex> lk(db_.mutex());
  if (!db_.is_available()) {
    r.reason = to_string(ErrorCode::unavailable);
    return r;
  }
  const auto current = get_claim_locked(claim_id);
  if (!current) {
    r.reason = to_string(ErrorCode::claim_not_found);
    return r;
  }
  r.previous = current->status;
  if (current->status == new_status) {
    r.ok = true;
    r.no_change = true;
    return r;
  }
  if (!is_allowed_claim_transition(current->status, new_status)) {
    r.reason = to_string(ErrorCode::invalid_transition);
    return r;
  }

  if (!db_.exec("BEGIN")) {
    r.reason = db_.last_error();
    return r;
  }
  Statement upd(db_.handle(), "UPDATE claims SET status = ?, updated_at = ? WHERE id = ?");
  upd.bind_text(1, to_string(new_status));
  upd.bind_int64(2, static_cast<std::int64_t>(now_ms));
  upd.bind_text(3, claim_id);
  Statement hist(db_.handle(),
                 "INSERT INTO claim_status_history (claim_id, old_status, new_status, changed_by,"
                 " reason, changed_at) VALUES (?, ?, ?, ?, ?, ?)");
  hist.bind_text(1, claim_id);
  hist.bind_text(2, to_string(current->status));
  hist.bind_text(3, to_string(new_status));
  hist.bind_text(4, actor.empty() ? std::string("system") : actor);
  hist.bind_text_or_null(5, reason_code);
  hist.bind_int64(6, static_cast<std::int64_t>(now_ms));
  if (!upd.step_done() || !hist.step_done()) {
    r.reason = db_.last_error();
    db_.exec("ROLLBACK");
    return r;
  }
  if (!db_.exec("COMMIT")) {
    r.reason = db_.last_error();
    db_.exec("ROLLBACK");
    return r;
  }
  r.ok = true;
  return r;
}

std::optional<Claim> SqliteClaimStore::get_claim(const std::string& claim_id) {
  std::lock_guard<std::mutex> lk(db_.mutex());
  if (!db_.is_available()) return std::nullopt;
  return get_claim_locked(claim_id);
}

std::optional<Claim> SqliteClaimStore::get_claim_locked(const std::string& claim_id) {
  Statement st(db_.handle(),
               "SELECT id, statement, owner, status, created_at, updated_at FROM claims"
               " WHERE id = ? LIMIT 1");
  st.bind_text(1, claim_id);
  if (!st.step_row()) return std::nullopt;
  Claim c;
  c.id = st.column_text(0);
  c.statement = st.column_text(1);
  c.owner = st.column_text(2);
  c.status = parse_claim_status(st.column_text(3)).value_or(ClaimStatus::proposed);
  c.created_at_ms = st.column_u64_opt(4).value_or(0);
  c.updated_at_ms = st.column_u64_opt(5).value_or(0);
  return c;
}

std::uint64_t SqliteClaimStore::evidence_count(const std::string& claim_id) {
  std::lock_guard<std::mutex> lk(db_.mutex());
  Statement st(db_.handle(), "SELECT COUNT(*) FROM claim_evidence WHERE claim_id = ?");
  st.bind_text(1, claim_id);
  if (!st.step_row()) return 0;
  return static_cast<std::uint64_t>(st.column_int64(0));
}

std::string claim_to_json(const Claim& c) {
  jsonlite::Object o;
  o["id"] = jsonlite::Value{c.id};
  o["statement"] = jsonlite::Value{c.statement};
  o["owner"] = jsonlite::Value{c.owner};
  o["status"] = jsonlite::Value{to_string(c.status)};
  o["createdAt"] = jsonlite::Value{c.created_at_ms};
  o["updatedAt"] = jsonlite::Value{c.updated_at_ms};
  return jsonlite::to_json(o);
}

}  // namespace assay
