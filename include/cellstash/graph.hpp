#pragma once

// cellstash/graph.hpp — Incremental dependency graph over known operations.
//
// MEMORY OWNERSHIP:
//   Nodes live in an arena keyed by op_id. Edges are op_id pairs held in
//   index maps, never pointers, so a child may be inserted before its
//   producer and a producer may be evicted while its children remain.
//
// DESIGN INVARIANTS:
//   1. Edge a -> b exists iff b consumes or reads a cell produced by a.
//      Because op_id commits to every input address, a real cycle requires
//      a hash collision. find_cycle() finding one means the known set is
//      corrupt.
//   2. A cell has at most one accepted consumer (spent_by). Any other
//      consumer of a spent cell is conflicted.
//   3. insert() does work proportional to the operation's inputs and the
//      children already waiting on it.
//   4. ready() holds exactly the non-terminal ops whose producers are all
//      accepted and whose consumed cells are all unspent. It is ordered, so
//      *ready().begin() is the canonical next op.

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "cellstash/types.hpp"

namespace cellstash {

struct InsertReport {
  OpStatus status{OpStatus::pending};
  ErrorCode error_code{ErrorCode::none};
  std::string detail;
};

struct AcceptEffects {
  std::vector<OpId> ready;       // children that became ready
  std::vector<OpId> conflicted;  // competitors for the cells just spent
};

class DependencyGraph {
 public:
  // Registers an operation that is accepted by construction (genesis) or by
  // recovery. Its consumed cells are marked spent.
  void insert_accepted(const Operation& op);

  // Inserts a new, non-accepted operation and classifies it. The caller is
  // responsible for cascading a terminal status via mark_terminal().
  InsertReport insert(const Operation& op, uint64_t arrival_round);

  AcceptEffects mark_accepted(const OpId& op_id);

  // Marks op terminal (conflicted or rejected) and every non-accepted
  // transitive dependent rejected. Returns the cascaded dependents, sorted.
  std::vector<OpId> mark_terminal(const OpId& op_id, OpStatus status);

  // Removes a pending op (eviction). Returns false for accepted or unknown ops.
  bool remove(const OpId& op_id);

  bool contains(const OpId& op_id) const { return nodes_.count(op_id) != 0; }
  OpStatus status(const OpId& op_id) const;

  const std::set<OpId>& ready() const { return ready_; }
  // Non-terminal, non-accepted ops (pending or ready), sorted.
  std::vector<OpId> unresolved() const;
  // Pending ops in arrival order.
  std::vector<OpId> pending_by_arrival() const;
  uint64_t arrival_round(const OpId& op_id) const;

  std::optional<OpId> spent_by(const CellAddr& addr) const;
  std::vector<OpId> consumers(const CellAddr& addr) const;
  std::vector<OpId> read_by(const CellAddr& addr) const;

  // Direct children known to the graph.
  std::vector<OpId> dependents(const OpId& op_id) const;
  // Direct parents named by op's inputs, known or not.
  std::vector<OpId> producers(const OpId& op_id) const;
  std::vector<OpId> missing_producers(const OpId& op_id) const;

  // A producer cycle among non-accepted ops, if any. The path starts and
  // ends with the same op_id.
  std::optional<std::vector<OpId>> find_cycle() const;

  size_t size() const { return nodes_.size(); }

 private:
  struct Node {
    OpId op_id;
    OpStatus status{OpStatus::pending};
    std::vector<CellAddr> consumed;
    std::vector<CellAddr> reading;
    std::set<OpId> parents;
    uint64_t arrival_seq{0};
    uint64_t arrival_round{0};
  };

  Node make_node(const Operation& op) const;
  void index_node(const Node& node);
  // Status from the current state of parents and spent cells.
  InsertReport classify(const Node& node) const;

  std::map<OpId, Node> nodes_;
  std::map<CellAddr, std::set<OpId>> consumers_;
  std::map<CellAddr, std::set<OpId>> readers_;
  std::map<CellAddr, OpId> spent_;
  std::map<OpId, std::set<OpId>> children_;  // producer -> ops naming its outputs
  std::set<OpId> ready_;
  uint64_t next_arrival_{0};
};

}  // namespace cellstash
