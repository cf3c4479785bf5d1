#pragma once

// assay/evidence_ledger.hpp — Append-only evidence ledger.
//
// DESIGN INVARIANTS:
//   1. APPEND-ONLY: complete lines are never modified or deleted. The only
//      write besides appending is recovery cutting an unparseable final
//      line (a torn write) back to the last complete record.
//   2. SEQUENTIAL: each line carries a monotonically increasing "seq",
//      continued across process restarts from the last line on disk.
//   3. CHAINED: "prev" is the BLAKE3 ledger_chain_hash of the previous line,
//      so any edit to history breaks every later link.
//   4. IDEMPOTENT: appending an event id that is already present returns
//      status "duplicate" and writes nothing.
//
// The runtime opens one ledger handle per completed run and always closes
// it, including after an init or append failure.
//
// REPLAY:
//   Handles on the same path share one in-process LedgerHead (replayed byte
//   offset, seq, chain head, known ids). init() parses only the bytes added
//   since the last replay, so opening a handle costs O(new lines), not
//   O(ledger). A file shorter than the replayed offset is replayed again
//   from the start.

#include <cstdint>
#include <cstdio>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "assay/jsonlite.hpp"

namespace assay {

struct EvidenceFileRef {
  std::string kind{"file"};
  std::string path;
  std::string hash;
  std::string note;
};

struct LedgerEvent {
  std::string event_id;
  std::string trace_id;
  std::string parent_event_id;
  std::string type;
  std::string stage;
  std::string source;
  std::string pane_id;
  std::string role;
  std::string direction;
  std::uint64_t ts_ms{0};
  jsonlite::Object payload;
  std::vector<EvidenceFileRef> evidence_refs;
  jsonlite::Object meta;
};

struct LedgerAppendOptions {
  std::string session_id;
  std::uint64_t now_ms{0};
};

struct LedgerInitResult {
  bool ok{false};
  std::string reason;
};

struct LedgerAppendResult {
  bool ok{false};
  std::string status;  // "inserted" | "duplicate"
  std::string reason;
  std::uint64_t seq{0};
};

class IEvidenceLedger {
 public:
  virtual ~IEvidenceLedger() = default;
  virtual LedgerInitResult init() = 0;
  virtual LedgerAppendResult append_event(const LedgerEvent& event,
                                          const LedgerAppendOptions& opts) = 0;
  virtual void close() = 0;
};

// Builds a ledger handle for (path, enabled). The runtime calls it once per
// completed run.
using LedgerFactory =
    std::function<std::unique_ptr<IEvidenceLedger>(const std::string& path, bool enabled)>;

struct LedgerHead;

class NdjsonEvidenceLedger : public IEvidenceLedger {
 public:
  NdjsonEvidenceLedger(std::string path, bool enabled);
  ~NdjsonEvidenceLedger() override;
  NdjsonEvidenceLedger(const NdjsonEvidenceLedger&) = delete;
  NdjsonEvidenceLedger& operator=(const NdjsonEvidenceLedger&) = delete;

  // Replays lines not seen yet to recover seq, the chain head and the set of
  // known event ids. A torn final line is cut; an unparseable line followed
  // by further data fails with "ledger_corrupt". Fails with
  // "ledger_disabled" when constructed disabled.
  LedgerInitResult init() override;
  LedgerAppendResult append_event(const LedgerEvent& event,
                                  const LedgerAppendOptions& opts) override;
  void close() override;

  const std::string& path() const { return path_; }

 private:
  std::string path_;
  bool enabled_{false};
  std::FILE* file_{nullptr};
  std::shared_ptr<LedgerHead> head_;
};

LedgerFactory default_ledger_factory();

std::string ledger_event_to_json(const LedgerEvent& event, std::uint64_t seq,
                                 const std::string& prev, const LedgerAppendOptions& opts);

// Walks the chain; returns the number of verified lines or -1 on the first
// broken link or malformed line.
long long verify_ledger_chain(const std::string& path);

}  // namespace assay
