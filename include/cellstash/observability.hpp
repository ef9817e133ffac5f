#pragma once

// cellstash/observability.hpp — Stash statistics and structured events.
//
// DESIGN:
//   StashEvent is the observable unit. Every classification the stash makes
//   (an operation submitted, accepted, conflicted, rejected or evicted, a
//   checkpoint, a recovery, a halt) emits one event, which is:
//     - counted in the global StashStats, always;
//     - forwarded to a registered hook, if any;
//     - otherwise appended as one JSON line to the event log, when one is
//       configured (set_event_log_path() or CELLSTASH_EVENT_LOG).
//
// EXTENSION_POINT: event_exporter
//   Current: JSONL file or in-process hook.
//   Upgrade path: an exporter that batches events to a collector.
//   Invariant: emission must never fail an operation. Sink errors are
//   counted, not propagated.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

#include "cellstash/types.hpp"

namespace cellstash {

struct StashEvent {
  std::string kind;  // submit | accept | conflict | reject | evict | checkpoint | recover | halt
  std::string contract_id;
  std::string op_id;
  std::string status;
  std::string error_code;
  std::string detail;
  uint64_t position{0};
  uint64_t duration_ns{0};
};

std::string event_to_json(const StashEvent& ev);

// Power-of-two microsecond buckets. Bucket i covers [2^(i-1), 2^i) us.
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);

  // p in [0.0, 1.0]; microseconds. 0.0 when empty.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<uint64_t> count_{0};
  alignas(64) std::atomic<uint64_t> sum_us_{0};
};

class StashStats {
 public:
  void record_event(const StashEvent& ev);
  std::string to_json() const;

  std::atomic<uint64_t> submitted{0};
  std::atomic<uint64_t> duplicates{0};
  std::atomic<uint64_t> malformed{0};
  std::atomic<uint64_t> pending{0};
  std::atomic<uint64_t> accepted{0};
  std::atomic<uint64_t> conflicted{0};
  std::atomic<uint64_t> rejected{0};
  std::atomic<uint64_t> evicted{0};
  std::atomic<uint64_t> checkpoints{0};
  std::atomic<uint64_t> recoveries{0};
  std::atomic<uint64_t> replayed{0};
  std::atomic<uint64_t> halts{0};
  std::atomic<uint64_t> persistence_failures{0};
  std::atomic<uint64_t> integrity_violations{0};
  std::atomic<uint64_t> sink_failures{0};

  LatencyHistogram commit_latency;
};

StashStats& global_stash_stats();

using StashEventHook = void (*)(const StashEvent&);

// Replaces the JSONL sink. nullptr restores it.
void set_stash_event_hook(StashEventHook hook);

// Overrides CELLSTASH_EVENT_LOG. "" falls back to the environment.
void set_event_log_path(const std::string& path);

void emit_stash_event(const StashEvent& ev);

// Records the lifetime of a scope into a histogram.
class ScopeTimer {
 public:
  explicit ScopeTimer(LatencyHistogram& histogram)
      : histogram_(histogram), start_(std::chrono::steady_clock::now()) {}
  ~ScopeTimer() { histogram_.record(elapsed_ns()); }

  uint64_t elapsed_ns() const {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                     std::chrono::steady_clock::now() - start_)
                                     .count());
  }

 private:
  LatencyHistogram& histogram_;
  std::chrono::steady_clock::time_point start_;
};

}  // namespace cellstash
