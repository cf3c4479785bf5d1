#pragma once

// assay/claims.hpp — Claims collaborator contract plus the SQLite-backed
// reference implementation.
//
// The runtime only ever talks to IClaimsCollaborator. Hosts that keep claims
// elsewhere pass their own implementation through RuntimeOptions.
//
// TRANSITIONS (same-status updates are a no-op, not an error):
//   proposed      -> confirmed | contested | pending_proof | deprecated
//   pending_proof -> confirmed | contested | deprecated
//   contested     -> confirmed | pending_proof | deprecated
//   confirmed     -> contested | pending_proof | deprecated
//   deprecated    -> (terminal)

#include <cstdint>
#include <optional>
#include <string>

#include "assay/types.hpp"

namespace assay {

class Database;

struct Claim {
  std::string id;
  std::string statement;
  std::string owner;
  ClaimStatus status{ClaimStatus::proposed};
  std::uint64_t created_at_ms{0};
  std::uint64_t updated_at_ms{0};
};

struct AddEvidenceOptions {
  std::string added_by{"system"};
  std::uint64_t now_ms{0};
};

struct AddEvidenceResult {
  bool ok{false};
  std::string status;  // "inserted" | "duplicate"
  std::string reason;  // failure reason when !ok
};

struct ClaimStatusUpdate {
  bool ok{false};
  bool no_change{false};
  std::string reason;
  std::optional<ClaimStatus> previous;
  ClaimStatus status{ClaimStatus::proposed};
};

class IClaimsCollaborator {
 public:
  virtual ~IClaimsCollaborator() = default;

  virtual AddEvidenceResult add_evidence(const std::string& claim_id,
                                         const std::string& evidence_ref,
                                         EvidenceRelation relation,
                                         const AddEvidenceOptions& opts) = 0;
  virtual ClaimStatusUpdate update_claim_status(const std::string& claim_id,
                                                ClaimStatus new_status,
                                                const std::string& actor,
                                                const std::string& reason_code,
                                                std::uint64_t now_ms) = 0;
  virtual std::optional<Claim> get_claim(const std::string& claim_id) = 0;
};

bool is_allowed_claim_transition(ClaimStatus from, ClaimStatus to);

class SqliteClaimStore : public IClaimsCollaborator {
 public:
  explicit SqliteClaimStore(Database& db) : db_(db) {}

  struct CreateResult {
    bool ok{false};
    std::string reason;
    Claim claim;
  };

  // Creates a claim. An empty id generates "clm_<random>".
  CreateResult create_claim(const std::string& id, const std::string& statement,
                            const std::string& owner, ClaimStatus status,
                            std::uint64_t now_ms);

  AddEvidenceResult add_evidence(const std::string& claim_id, const std::string& evidence_ref,
                                 EvidenceRelation relation,
                                 const AddEvidenceOptions& opts) override;
  ClaimStatusUpdate update_claim_status(const std::string& claim_id, ClaimStatus new_status,
                                        const std::string& actor,
                                        const std::string& reason_code,
                                        std::uint64_t now_ms) override;
  std::optional<Claim> get_claim(const std::string& claim_id) override;

  std::uint64_t evidence_count(const std::string& claim_id);

 private:
  std::optional<Claim> get_claim_locked(const std::string& claim_id);

  Database& db_;
};

std::string claim_to_json(const Claim& claim);

}  // namespace assay
