#pragma once

// cellstash/op_store.hpp — Content-addressed store of known operations.
//
// INVARIANTS:
//   - An operation enters the store only if its op_id matches the
//     recomputed commitment and its structure is well formed.
//   - put() is durable before it reports accepted_new: the operation is
//     written through the persistence adapter first, and a failed write
//     leaves the store unchanged.
//   - put() is idempotent. A second put of the same content reports
//     already_present and writes nothing.

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "cellstash/persistence.hpp"
#include "cellstash/types.hpp"

namespace cellstash {

struct PutResult {
  PutStatus status{PutStatus::malformed};
  ErrorCode error_code{ErrorCode::none};
  std::string detail;
};

class OperationStore {
 public:
  OperationStore(std::string contract_id, IStashPersistence& persistence)
      : contract_id_(std::move(contract_id)), persistence_(persistence) {}

  PutResult put(const Operation& op);

  // Re-registers an operation read back from durable storage. No write.
  void restore(const Operation& op) { ops_[op.op_id] = op; }

  // Drops an evicted operation. The eviction record is written by the caller.
  void erase(const OpId& op_id) { ops_.erase(op_id); }

  std::optional<Operation> get(const OpId& op_id) const;
  const Operation* find(const OpId& op_id) const;
  bool contains(const OpId& op_id) const { return ops_.count(op_id) != 0; }
  size_t size() const { return ops_.size(); }

  // All known op ids, sorted.
  std::vector<OpId> ids() const;

 private:
  std::string contract_id_;
  IStashPersistence& persistence_;
  std::map<OpId, Operation> ops_;
};

}  // namespace cellstash
