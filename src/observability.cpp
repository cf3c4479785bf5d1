#include "assay/observability.hpp"

#include <bit>
#include <cstdio>
#include <iostream>

#include "assay/jsonlite.hpp"

namespace assay {

namespace {

// bit_width gives the bucket index in O(1); equivalent to floor(log2(x)) + 1.
inline size_t bucket_for_ms(uint64_t duration_ms) {
  if (duration_ms == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_ms));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

std::atomic<RuntimeEventHook> g_event_hook{nullptr};

}  // namespace

std::string to_string(RuntimeEventKind kind) {
  switch (kind) {
    case RuntimeEventKind::queued: return "experiment.queued";
    case RuntimeEventKind::duplicate: return "experiment.duplicate";
    case RuntimeEventKind::rejected: return "experiment.rejected";
    case RuntimeEventKind::started: return "experiment.started";
    case RuntimeEventKind::completed: return "experiment.completed";
    case RuntimeEventKind::abandoned: return "experiment.abandoned";
    case RuntimeEventKind::worker_error: return "runtime.worker_error";
    case RuntimeEventKind::integration_warning: return "runtime.integration_warning";
  }
  return "";
}

std::string RuntimeEvent::to_json() const {
  using jsonlite::Value;
  jsonlite::Object o;
  o["event"] = Value{to_string(kind)};
  o["ts"] = Value{ts_ms};
  if (!run_id.empty()) o["run_id"] = Value{run_id};
  if (!profile_id.empty()) o["profile"] = Value{profile_id};
  if (!status.empty()) o["status"] = Value{status};
  if (!error_code.empty()) o["error_code"] = Value{error_code};
  if (!detail.empty()) o["detail"] = Value{detail};
  if (has_exit_code) o["exit_code"] = jsonlite::int_value(exit_code);
  if (kind == RuntimeEventKind::completed) o["duration_ms"] = Value{duration_ms};
  o["queue_depth"] = Value{queue_depth};
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ms) {
  buckets_[bucket_for_ms(duration_ms)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_ms_.fetch_add(duration_ms, std::memory_order_relaxed);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target) {
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  const double mean = n == 0 ? 0.0
      : static_cast<double>(sum_ms_.load(std::memory_order_relaxed)) / static_cast<double>(n);
  std::string out;
  out.reserve(128);
  char buf[32];
  out += "{\"count\":";
  out += std::to_string(n);
  out += ",\"mean_ms\":";
  std::snprintf(buf, sizeof(buf), "%.2f", mean);
  out += buf;
  out += ",\"p50_ms\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.50));
  out += buf;
  out += ",\"p95_ms\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.95));
  out += buf;
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// RuntimeStats
// ---------------------------------------------------------------------------

void RuntimeStats::record(const RuntimeEvent& ev) {
  switch (ev.kind) {
    case RuntimeEventKind::queued:
      submitted.fetch_add(1, std::memory_order_relaxed);
      break;
    case RuntimeEventKind::duplicate:
      duplicates.fetch_add(1, std::memory_order_relaxed);
      break;
    case RuntimeEventKind::rejected:
      rejected.fetch_add(1, std::memory_order_relaxed);
      break;
    case RuntimeEventKind::started:
      started.fetch_add(1, std::memory_order_relaxed);
      break;
    case RuntimeEventKind::completed:
      if (ev.status == "timed_out") {
        timed_out.fetch_add(1, std::memory_order_relaxed);
      } else if (ev.status == "succeeded") {
        succeeded.fetch_add(1, std::memory_order_relaxed);
      } else {
        failed.fetch_add(1, std::memory_order_relaxed);
      }
      run_duration.record(ev.duration_ms);
      break;
    case RuntimeEventKind::abandoned:
      abandoned.fetch_add(1, std::memory_order_relaxed);
      break;
    case RuntimeEventKind::worker_error:
      worker_errors.fetch_add(1, std::memory_order_relaxed);
      break;
    case RuntimeEventKind::integration_warning:
      integration_warnings.fetch_add(1, std::memory_order_relaxed);
      break;
  }
}

std::string RuntimeStats::to_json() const {
  std::string out;
  out.reserve(384);
  auto field = [&out](const char* name, const std::atomic<uint64_t>& v, bool first = false) {
    if (!first) out += ',';
    out += '"';
    out += name;
    out += "\":";
    out += std::to_string(v.load(std::memory_order_relaxed));
  };
  out += '{';
  field("submitted", submitted, true);
  field("duplicates", duplicates);
  field("rejected", rejected);
  field("started", started);
  field("succeeded", succeeded);
  field("failed", failed);
  field("timed_out", timed_out);
  field("abandoned", abandoned);
  field("kills", kills);
  field("worker_errors", worker_errors);
  field("integration_warnings", integration_warnings);
  out += ",\"run_duration\":";
  out += run_duration.to_json();
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// EventSink
// ---------------------------------------------------------------------------

EventSink::EventSink(std::string log_path, bool mirror_stderr)
    : log_path_(std::move(log_path)), mirror_stderr_(mirror_stderr) {}

void set_runtime_event_hook(RuntimeEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void EventSink::emit(const RuntimeEvent& ev, RuntimeStats& stats) {
  stats.record(ev);

  const std::string line = ev.to_json();
  if (mirror_stderr_ && ev.is_warning()) {
    std::cerr << line << "\n";
  }

  RuntimeEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  if (log_path_.empty()) return;
  std::lock_guard<std::mutex> lk(mu_);
  // Append mode: O_APPEND writes below PIPE_BUF are atomic on POSIX.
  if (FILE* f = std::fopen(log_path_.c_str(), "a")) {
    const std::string framed = line + "\n";
    std::fwrite(framed.data(), 1, framed.size(), f);
    std::fclose(f);
  }
}

}  // namespace assay
