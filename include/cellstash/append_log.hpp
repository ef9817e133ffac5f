#pragma once

// cellstash/append_log.hpp — Chained, append-only NDJSON record log.
//
// DESIGN INVARIANTS (must not be broken):
//   1. APPEND-ONLY: records are never modified or deleted. The only
//      exception is a torn final line left by a crash mid-write, which open()
//      truncates because it was never acknowledged.
//   2. SEQUENTIAL: record n carries seq = n (1-based), strictly increasing.
//   3. CHAINED: each record carries prev = BLAKE3("log:" || previous line),
//      the all-zero digest for the first record. A break anywhere except the
//      final line is tampering, not a crash, and fails open().
//   4. DURABLE: append() returns true only after fflush + fsync. If it
//      returns false the caller must treat the record as not written.
//
// EXTENSION_POINT: log_segmentation
//   Current: one file per log, grows without bound.
//   Upgrade path: roll segments at checkpoint boundaries and carry the last
//   digest of segment k as prev of segment k+1's first record.

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include "cellstash/jsonlite.hpp"

namespace cellstash {

inline constexpr const char* kGenesisChainDigest =
    "0000000000000000000000000000000000000000000000000000000000000000";

struct LogRecord {
  uint64_t seq{0};
  std::string prev;
  std::string kind;
  jsonlite::Object body;  // record fields without seq/prev/kind
};

struct LogOpenReport {
  uint64_t records{0};
  bool torn_tail_dropped{false};
  bool chain_broken{false};
};

class AppendLog {
 public:
  explicit AppendLog(std::string path);
  ~AppendLog();

  AppendLog(const AppendLog&) = delete;
  AppendLog& operator=(const AppendLog&) = delete;

  // Reads and validates the whole log, then positions for appending.
  // Creates the file if absent. Returns false on a chain break or I/O error.
  bool open(std::vector<LogRecord>* records, LogOpenReport* report, std::string* error);

  // Appends one record. `body` must not use the keys seq, prev or kind.
  bool append(const std::string& kind, const jsonlite::Object& body, std::string* error);

  uint64_t last_seq() const { return seq_; }
  const std::string& last_digest() const { return last_digest_; }
  const std::string& path() const { return path_; }

 private:
  std::string path_;
  FILE* file_{nullptr};
  uint64_t seq_{0};
  std::string last_digest_{kGenesisChainDigest};
};

}  // namespace cellstash
