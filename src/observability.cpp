#include "cellstash/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>
#include <mutex>

#include "cellstash/jsonlite.hpp"

namespace cellstash {

namespace {

// std::bit_width gives floor(log2(x)) + 1 in one instruction.
inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

void append_fixed(std::string& out, const char* fmt, double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), fmt, v);
  out += buf;
}

}  // namespace

std::string event_to_json(const StashEvent& ev) {
  jsonlite::Object o;
  o["kind"] = jsonlite::Value{ev.kind};
  o["contract_id"] = jsonlite::Value{ev.contract_id};
  o["op_id"] = jsonlite::Value{ev.op_id};
  o["status"] = jsonlite::Value{ev.status};
  o["error_code"] = jsonlite::Value{ev.error_code};
  if (!ev.detail.empty()) o["detail"] = jsonlite::Value{ev.detail};
  o["position"] = jsonlite::Value{ev.position};
  o["duration_ns"] = jsonlite::Value{ev.duration_ns};
  return jsonlite::serialize(o);
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
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
  std::string out;
  out.reserve(160);
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_us\":";
  append_fixed(out, "%.2f", mean_us());
  out += ",\"p50_us\":";
  append_fixed(out, "%.2f", percentile(0.50));
  out += ",\"p95_us\":";
  append_fixed(out, "%.2f", percentile(0.95));
  out += ",\"p99_us\":";
  append_fixed(out, "%.2f", percentile(0.99));
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// StashStats
// ---------------------------------------------------------------------------

void StashStats::record_event(const StashEvent& ev) {
  auto bump = [](std::atomic<uint64_t>& c) { c.fetch_add(1, std::memory_order_relaxed); };
  if (ev.kind == "submit") {
    bump(submitted);
    if (ev.status == "already_present") bump(duplicates);
    if (ev.status == "malformed") bump(malformed);
    if (ev.status == "pending") bump(pending);
  } else if (ev.kind == "accept") {
    bump(accepted);
  } else if (ev.kind == "conflict") {
    bump(conflicted);
  } else if (ev.kind == "reject") {
    bump(rejected);
  } else if (ev.kind == "evict") {
    bump(evicted);
  } else if (ev.kind == "checkpoint") {
    bump(checkpoints);
  } else if (ev.kind == "recover") {
    bump(recoveries);
    replayed.fetch_add(ev.position, std::memory_order_relaxed);
  } else if (ev.kind == "halt") {
    bump(halts);
    if (ev.error_code == "persistence_failure") bump(persistence_failures);
    if (ev.error_code == "integrity_violation") bump(integrity_violations);
  }
}

std::string StashStats::to_json() const {
  auto load = [](const std::atomic<uint64_t>& c) {
    return std::to_string(c.load(std::memory_order_relaxed));
  };
  std::string out;
  out.reserve(512);
  out += "{\"submitted\":" + load(submitted);
  out += ",\"duplicates\":" + load(duplicates);
  out += ",\"malformed\":" + load(malformed);
  out += ",\"pending\":" + load(pending);
  out += ",\"accepted\":" + load(accepted);
  out += ",\"conflicted\":" + load(conflicted);
  out += ",\"rejected\":" + load(rejected);
  out += ",\"evicted\":" + load(evicted);
  out += ",\"checkpoints\":" + load(checkpoints);
  out += ",\"recoveries\":" + load(recoveries);
  out += ",\"replayed\":" + load(replayed);
  out += ",\"halts\":" + load(halts);
  out += ",\"persistence_failures\":" + load(persistence_failures);
  out += ",\"integrity_violations\":" + load(integrity_violations);
  out += ",\"sink_failures\":" + load(sink_failures);
  out += ",\"commit_latency\":" + commit_latency.to_json();
  out += '}';
  return out;
}

StashStats& global_stash_stats() {
  static StashStats inst;
  return inst;
}

// ---------------------------------------------------------------------------
// Event emission
// ---------------------------------------------------------------------------

namespace {
std::atomic<StashEventHook> g_event_hook{nullptr};
std::mutex g_sink_mu;
std::string g_event_log_path;
}  // namespace

void set_stash_event_hook(StashEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void set_event_log_path(const std::string& path) {
  std::lock_guard<std::mutex> lk(g_sink_mu);
  g_event_log_path = path;
}

void emit_stash_event(const StashEvent& ev) {
  global_stash_stats().record_event(ev);

  if (StashEventHook hook = g_event_hook.load(std::memory_order_acquire)) {
    hook(ev);
    return;
  }

  std::lock_guard<std::mutex> lk(g_sink_mu);
  std::string path = g_event_log_path;
  if (path.empty()) {
    const char* env = std::getenv("CELLSTASH_EVENT_LOG");
    if (!env || !env[0]) return;
    path = env;
  }
  const std::string line = event_to_json(ev) + "\n";
  FILE* f = std::fopen(path.c_str(), "a");
  if (!f || std::fwrite(line.data(), 1, line.size(), f) != line.size()) {
    global_stash_stats().sink_failures.fetch_add(1, std::memory_order_relaxed);
  }
  if (f) std::fclose(f);
}

}  // namespace cellstash
