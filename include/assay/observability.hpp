#pragma once

// assay/observability.hpp — Structured runtime observability.
//
// DESIGN:
//   RuntimeEvent is the observable unit. The runtime emits one event per
//   lifecycle transition (queued, started, completed, abandoned) and one per
//   swallowed failure (worker_error, integration_warning). Each event:
//     - updates the owning runtime's RuntimeStats counters,
//     - goes to the process-wide hook if one is registered, otherwise
//     - is appended as one JSON line to the configured event log file.
//   Warnings and errors are mirrored to stderr as single-line JSON when
//   stderr mirroring is enabled (ASSAY_LOG_STDERR=1).
//
//   Events never carry stdout/stderr content, only digests and metadata.
//   Emission never throws and never blocks the worker on a slow sink beyond
//   one fopen/fwrite/fclose.

#include <array>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

namespace assay {

enum class RuntimeEventKind {
  queued,
  duplicate,
  rejected,
  started,
  completed,
  abandoned,
  worker_error,
  integration_warning,
};

std::string to_string(RuntimeEventKind kind);

struct RuntimeEvent {
  RuntimeEventKind kind{RuntimeEventKind::queued};
  std::string run_id;
  std::string profile_id;
  std::string status;          // ExperimentStatus name, when known
  std::string error_code;      // ErrorCode name for rejected/worker_error
  std::string detail;          // free-form annotation, never output content
  int exit_code{0};
  bool has_exit_code{false};
  uint64_t duration_ms{0};
  uint64_t queue_depth{0};
  uint64_t ts_ms{0};

  bool is_warning() const {
    return kind == RuntimeEventKind::worker_error ||
           kind == RuntimeEventKind::integration_warning ||
           kind == RuntimeEventKind::abandoned;
  }
  std::string to_json() const;
};

// ---------------------------------------------------------------------------
// LatencyHistogram: power-of-two bucket histogram over run durations.
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) ms, 2^i ms); bucket 0 is [0, 1ms).
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ms);

  // Approximate percentile in milliseconds. p in [0.0, 1.0].
  double percentile(double p) const;
  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  std::string to_json() const;

 private:
  std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  std::atomic<uint64_t> count_{0};
  std::atomic<uint64_t> sum_ms_{0};
};

// ---------------------------------------------------------------------------
// RuntimeStats: per-runtime counters. Thread-safe; all counters are atomic.
// ---------------------------------------------------------------------------
class RuntimeStats {
 public:
  void record(const RuntimeEvent& ev);
  std::string to_json() const;

  std::atomic<uint64_t> submitted{0};
  std::atomic<uint64_t> duplicates{0};
  std::atomic<uint64_t> rejected{0};
  std::atomic<uint64_t> started{0};
  std::atomic<uint64_t> succeeded{0};
  std::atomic<uint64_t> failed{0};
  std::atomic<uint64_t> timed_out{0};
  std::atomic<uint64_t> abandoned{0};
  std::atomic<uint64_t> kills{0};
  std::atomic<uint64_t> worker_errors{0};
  std::atomic<uint64_t> integration_warnings{0};

  LatencyHistogram run_duration;
};

// ---------------------------------------------------------------------------
// EventSink: JSONL file sink plus optional stderr mirror.
// ---------------------------------------------------------------------------
class EventSink {
 public:
  EventSink() = default;
  EventSink(std::string log_path, bool mirror_stderr);

  void emit(const RuntimeEvent& ev, RuntimeStats& stats);
  const std::string& log_path() const { return log_path_; }

 private:
  std::string log_path_;
  bool mirror_stderr_{false};
  std::mutex mu_;
};

// Process-wide interception hook (embedding hosts, tests).
using RuntimeEventHook = void (*)(const RuntimeEvent&);
void set_runtime_event_hook(RuntimeEventHook hook);

}  // namespace assay
