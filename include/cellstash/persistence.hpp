#pragma once

// cellstash/persistence.hpp — Durable storage seam for a stash.
//
// DESIGN INVARIANTS (must not be broken by any implementation):
//   1. Every mutating call returns true only once the data is durable.
//      A false return means nothing was recorded and the caller halts.
//   2. load() returns records in exactly the order they were appended.
//   3. The articles are written once. Writing different articles to an
//      existing store fails.
//
// Three logical streams are kept:
//   operations  every acknowledged operation, plus eviction records
//   order       the accepted sequence (op ids with their position)
//   checkpoint  the latest snapshot and the op id it covers
//
// EXTENSION_POINT: remote_persistence
//   Current: MemoryPersistence (tests) and FilePersistence (local dir).
//   Upgrade path: a replicated backend that acknowledges after a quorum of
//   remote appends. The interface does not change.

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cellstash/append_log.hpp"
#include "cellstash/articles.hpp"
#include "cellstash/blob_store.hpp"
#include "cellstash/state.hpp"
#include "cellstash/types.hpp"

namespace cellstash {

struct OrderEntry {
  OpId op_id;
  uint64_t position{0};  // index in the accepted sequence; genesis is 0
};

struct CheckpointRecord {
  uint64_t position{0};  // snapshot.position
  OpId up_to;            // last op folded into the snapshot
  std::string digest;    // snapshot_digest(snapshot)
  StateSnapshot snapshot;
};

// One record of the operations stream. Eviction records are interleaved
// with operations because an evicted op may later be resubmitted. Verdict
// records pin a rejection that depended on the state at evaluation time.
struct JournalEntry {
  enum class Kind { operation, eviction, verdict };
  Kind kind{Kind::operation};
  Operation op;  // kind == operation
  OpId op_id;
  ErrorCode code{ErrorCode::none};  // kind == verdict
  std::string detail;               // kind == verdict
};

struct LoadedStash {
  std::optional<Articles> articles;
  std::vector<JournalEntry> journal;  // in append order
  std::vector<OrderEntry> order;
  std::optional<CheckpointRecord> checkpoint;
  bool torn_tail_dropped{false};
  // Set by a failed load(): integrity_violation when stored data is
  // corrupt, persistence_failure when it could not be read.
  ErrorCode failure{ErrorCode::none};
};

class IStashPersistence {
 public:
  virtual ~IStashPersistence() = default;

  virtual bool write_articles(const Articles& articles, std::string* error) = 0;
  virtual bool append_operation(const Operation& op, std::string* error) = 0;
  virtual bool append_eviction(const OpId& op_id, const std::string& reason, std::string* error) = 0;
  virtual bool append_verdict(const OpId& op_id, ErrorCode code, const std::string& detail,
                              std::string* error) = 0;
  virtual bool append_order(const OrderEntry& entry, std::string* error) = 0;
  virtual bool checkpoint(const StateSnapshot& snapshot, const OpId& up_to, std::string* error) = 0;
  virtual bool load(LoadedStash* out, std::string* error) = 0;

  virtual std::string backend_id() const = 0;
};

// In-memory implementation with write-fault injection for tests.
class MemoryPersistence final : public IStashPersistence {
 public:
  bool write_articles(const Articles& articles, std::string* error) override;
  bool append_operation(const Operation& op, std::string* error) override;
  bool append_eviction(const OpId& op_id, const std::string& reason, std::string* error) override;
  bool append_verdict(const OpId& op_id, ErrorCode code, const std::string& detail,
                      std::string* error) override;
  bool append_order(const OrderEntry& entry, std::string* error) override;
  bool checkpoint(const StateSnapshot& snapshot, const OpId& up_to, std::string* error) override;
  bool load(LoadedStash* out, std::string* error) override;
  std::string backend_id() const override { return "memory"; }

  // Every write after `n` more successful writes fails. -1 disables.
  void fail_after(int n) { fail_after_ = n; }

  size_t checkpoint_count() const { return checkpoints_; }

 private:
  bool take_write(std::string* error);

  std::optional<Articles> articles_;
  std::vector<JournalEntry> journal_;
  std::vector<OrderEntry> order_;
  std::optional<CheckpointRecord> checkpoint_;
  size_t checkpoints_{0};
  int fail_after_{-1};
};

// Directory-backed implementation:
//   <dir>/articles.json
//   <dir>/operations.ndjson
//   <dir>/order.ndjson
//   <dir>/checkpoints/        (BlobStore)
//   <dir>/checkpoint.head
class FilePersistence final : public IStashPersistence {
 public:
  explicit FilePersistence(std::string dir, std::string compression = "off");

  bool write_articles(const Articles& articles, std::string* error) override;
  bool append_operation(const Operation& op, std::string* error) override;
  bool append_eviction(const OpId& op_id, const std::string& reason, std::string* error) override;
  bool append_verdict(const OpId& op_id, ErrorCode code, const std::string& detail,
                      std::string* error) override;
  bool append_order(const OrderEntry& entry, std::string* error) override;
  bool checkpoint(const StateSnapshot& snapshot, const OpId& up_to, std::string* error) override;
  bool load(LoadedStash* out, std::string* error) override;
  std::string backend_id() const override { return "file"; }

  const std::string& dir() const { return dir_; }

 private:
  bool ensure_open(std::string* error);

  std::string dir_;
  std::string compression_;
  AppendLog operations_;
  AppendLog order_;
  BlobStore blobs_;
  bool opened_{false};
};

std::unique_ptr<IStashPersistence> make_persistence(const std::string& dir,
                                                    const std::string& compression);

}  // namespace cellstash
