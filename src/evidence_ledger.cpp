#include "assay/evidence_ledger.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <unordered_set>

#include "assay/hash.hpp"
#include "assay/version.hpp"

namespace fs = std::filesystem;

namespace assay {

namespace {

const std::string kGenesisDigest(64, '0');

jsonlite::Array refs_to_array(const std::vector<EvidenceFileRef>& refs) {
  jsonlite::Array out;
  for (const auto& r : refs) {
    jsonlite::Object o;
    o["kind"] = jsonlite::Value{r.kind};
    o["path"] = jsonlite::Value{r.path};
    o["hash"] = jsonlite::Value{r.hash};
    o["note"] = jsonlite::Value{r.note};
    out.push_back(jsonlite::Value{std::move(o)});
  }
  return out;
}

}  // namespace

// Replay state shared by every handle on one path. Guarded by `mu`.
struct LedgerHead {
  std::mutex mu;
  std::uint64_t offset{0};  // bytes of the file already replayed
  std::uint64_t seq{0};
  std::string digest{kGenesisDigest};
  std::unordered_set<std::string> ids;
};

namespace {

std::shared_ptr<LedgerHead> acquire_head(const std::string& path) {
  static std::mutex registry_mu;
  static std::map<std::string, std::shared_ptr<LedgerHead>> registry;
  std::lock_guard<std::mutex> lk(registry_mu);
  auto& head = registry[path];
  if (!head) head = std::make_shared<LedgerHead>();
  return head;
}

void reset_head(LedgerHead& head) {
  head.offset = 0;
  head.seq = 0;
  head.digest = kGenesisDigest;
  head.ids.clear();
}

// Parses the lines appended since head.offset. Caller holds head.mu.
// Returns an empty string on success or the failure reason.
std::string replay_new_lines(LedgerHead& head, const std::string& path) {
  std::error_code ec;
  const std::uintmax_t size = fs::exists(path, ec) ? fs::file_size(path, ec) : 0;
  if (ec) return "ledger_stat_failed";
  if (size < head.offset) reset_head(head);
  if (size == head.offset) return "";

  bool torn_tail = false;
  bool missing_newline = false;
  std::uint64_t torn_at = 0;
  {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) return "ledger_open_failed";
    ifs.seekg(static_cast<std::streamoff>(head.offset));
    std::string line;
    while (std::getline(ifs, line)) {
      const bool terminated = !ifs.eof();
      const std::uint64_t consumed = line.size() + (terminated ? 1 : 0);
      if (line.empty()) {
        head.offset += consumed;
        continue;
      }
      std::optional<jsonlite::JsonError> err;
      const jsonlite::Object o = jsonlite::parse(line, &err);
      if (err) {
        if (ifs.peek() != std::char_traits<char>::eof()) return "ledger_corrupt";
        torn_tail = true;
        torn_at = head.offset;
        break;
      }
      head.seq = jsonlite::get_u64(o, "seq", head.seq);
      head.ids.insert(jsonlite::get_string(o, "eventId"));
      head.digest = ledger_chain_hash(line);
      head.offset += consumed;
      missing_newline = !terminated;
    }
  }

  if (torn_tail) {
    fs::resize_file(path, torn_at, ec);
    if (ec) return "ledger_corrupt";
  } else if (missing_newline) {
    // The record is complete; only its terminator was lost.
    std::ofstream ofs(path, std::ios::binary | std::ios::app);
    ofs << '\n';
    ofs.flush();
    if (!ofs) return "ledger_write_failed";
    head.offset += 1;
  }
  return "";
}

}  // namespace

std::string ledger_event_to_json(const LedgerEvent& e, std::uint64_t seq,
                                 const std::string& prev, const LedgerAppendOptions& opts) {
  using jsonlite::Value;
  jsonlite::Object o;
  o["v"] = Value{static_cast<std::uint64_t>(version::LEDGER_EVENT_VERSION)};
  o["seq"] = Value{seq};
  o["prev"] = Value{prev};
  o["eventId"] = Value{e.event_id};
  o["traceId"] = jsonlite::str_or_null(e.trace_id);
  o["parentEventId"] = jsonlite::str_or_null(e.parent_event_id);
  o["type"] = Value{e.type};
  o["stage"] = jsonlite::str_or_null(e.stage);
  o["source"] = jsonlite::str_or_null(e.source);
  o["paneId"] = jsonlite::str_or_null(e.pane_id);
  o["role"] = jsonlite::str_or_null(e.role);
  o["direction"] = jsonlite::str_or_null(e.direction);
  o["ts"] = Value{e.ts_ms};
  o["ingestedAt"] = Value{opts.now_ms ? opts.now_ms : e.ts_ms};
  o["sessionId"] = jsonlite::str_or_null(opts.session_id);
  o["payload"] = Value{e.payload};
  o["evidenceRefs"] = Value{refs_to_array(e.evidence_refs)};
  o["meta"] = Value{e.meta};
  return jsonlite::to_json(o);
}

NdjsonEvidenceLedger::NdjsonEvidenceLedger(std::string path, bool enabled)
    : path_(std::move(path)), enabled_(enabled) {}

NdjsonEvidenceLedger::~NdjsonEvidenceLedger() { close(); }

LedgerInitResult NdjsonEvidenceLedger::init() {
  LedgerInitResult r;
  if (!enabled_) {
    r.reason = "ledger_disabled";
    return r;
  }
  if (path_.empty()) {
    r.reason = "ledger_path_required";
    return r;
  }
  std::error_code ec;
  const fs::path target(path_);
  if (target.has_parent_path()) fs::create_directories(target.parent_path(), ec);

  head_ = acquire_head(path_);
  {
    std::lock_guard<std::mutex> lk(head_->mu);
    const std::string reason = replay_new_lines(*head_, path_);
    if (!reason.empty()) {
      r.reason = reason;
      return r;
    }
  }

  file_ = std::fopen(path_.c_str(), "ab");
  if (!file_) {
    r.reason = "ledger_open_failed";
    return r;
  }
  r.ok = true;
  return r;
}

LedgerAppendResult NdjsonEvidenceLedger::append_event(const LedgerEvent& event,
                                                      const LedgerAppendOptions& opts) {
  LedgerAppendResult r;
  if (!file_) {
    r.reason = "ledger_not_initialized";
    return r;
  }
  if (event.event_id.empty() || event.type.empty()) {
    r.reason = "ledger_invalid_event";
    return r;
  }
  std::lock_guard<std::mutex> lk(head_->mu);

  // Seek to end before writing so the file only ever grows.
  std::fflush(file_);
  std::fseek(file_, 0, SEEK_END);
  const long pre_write_pos = std::ftell(file_);
  if (pre_write_pos < 0) {
    r.reason = "ledger_seek_failed";
    return r;
  }
  if (static_cast<std::uint64_t>(pre_write_pos) != head_->offset) {
    // Another writer appended since init: catch up before chaining.
    const std::string reason = replay_new_lines(*head_, path_);
    if (!reason.empty()) {
      r.reason = reason;
      return r;
    }
    std::fseek(file_, 0, SEEK_END);
  }

  if (head_->ids.contains(event.event_id)) {
    r.ok = true;
    r.status = "duplicate";
    r.seq = head_->seq;
    return r;
  }

  const std::uint64_t seq = head_->seq + 1;
  const std::string line = ledger_event_to_json(event, seq, head_->digest, opts);
  const std::string final_line = line + "\n";
  const long start_pos = std::ftell(file_);
  const bool written =
      std::fwrite(final_line.data(), 1, final_line.size(), file_) == final_line.size();
  std::fflush(file_);
  if (!written) {
    r.reason = "ledger_write_failed";
    return r;
  }
  const long post_write_pos = std::ftell(file_);
  if (start_pos < 0 || post_write_pos < start_pos + static_cast<long>(final_line.size())) {
    r.reason = "ledger_append_violation";
    return r;
  }

  head_->seq = seq;
  head_->digest = ledger_chain_hash(line);
  head_->ids.insert(event.event_id);
  head_->offset = static_cast<std::uint64_t>(post_write_pos);
  r.ok = true;
  r.status = "inserted";
  r.seq = seq;
  return r;
}

void NdjsonEvidenceLedger::close() {
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

LedgerFactory default_ledger_factory() {
  return [](const std::string& path, bool enabled) -> std::unique_ptr<IEvidenceLedger> {
    return std::make_unique<NdjsonEvidenceLedger>(path, enabled);
  };
}

long long verify_ledger_chain(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return -1;
  std::string prev = kGenesisDigest;
  std::uint64_t expected_seq = 1;
  long long verified = 0;
  std::string line;
  while (std::getline(ifs, line)) {
    if (line.empty()) continue;
    std::optional<jsonlite::JsonError> err;
    const jsonlite::Object o = jsonlite::parse(line, &err);
    if (err) return -1;
    if (jsonlite::get_string(o, "prev") != prev) return -1;
    if (jsonlite::get_u64(o, "seq") != expected_seq) return -1;
    prev = ledger_chain_hash(line);
    ++expected_seq;
    ++verified;
  }
  return verified;
}

}  // namespace assay
