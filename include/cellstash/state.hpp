#pragma once

// cellstash/state.hpp — State Snapshot and the State Evaluator fold.
//
// DESIGN INVARIANTS:
//   1. A snapshot is a pure function of (articles, accepted prefix). It is
//      never treated as ambient mutable state; checkpoints only cache it.
//   2. evaluate() either applies an operation completely or leaves the
//      snapshot untouched. There is no partial application.
//   3. Serialization is canonical (sorted keys, ordered maps), so
//      snapshot_digest() agrees across parties holding the same prefix.

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "cellstash/articles.hpp"
#include "cellstash/jsonlite.hpp"
#include "cellstash/types.hpp"
#include "cellstash/verifier.hpp"

namespace cellstash {

struct StateSnapshot {
  std::map<CellAddr, Cell> owned;
  std::map<CellAddr, GlobalCell> global;
  // owner token -> live owned cells guarded by it
  std::map<std::string, std::set<CellAddr>> by_owner;
  uint64_t position{0};  // accepted operations folded in, genesis included
  OpId last_op;

  const Cell* find_owned(const CellAddr& addr) const;
  const GlobalCell* find_global(const CellAddr& addr) const;
  std::vector<Cell> cells_owned_by(const std::string& owner_token) const;

  bool operator==(const StateSnapshot& o) const {
    return owned == o.owned && global == o.global && by_owner == o.by_owner &&
           position == o.position && last_op == o.last_op;
  }
};

// Snapshot after the genesis operation alone.
StateSnapshot genesis_snapshot(const Articles& articles);

// Applies a verified operation. Consumed cells are removed, produced cells
// inserted. Returns the transition record (the destroyed cells).
Transition apply(StateSnapshot& snapshot, const Operation& op, const VerifyResult& verified);

struct EvalOutcome {
  bool ok{false};
  ErrorCode error_code{ErrorCode::none};
  std::string detail;
  Transition transition;
};

// Gathers the live input cells an operation names. Fails with
// unresolved_dependency when one is not live in the snapshot.
bool collect_inputs(const StateSnapshot& snapshot, const Operation& op, std::vector<Cell>* consumed,
                    std::vector<GlobalCell>* read, std::string* error);

class StateEvaluator {
 public:
  StateEvaluator(const Articles& articles, const IVerifier& verifier)
      : articles_(articles), verifier_(verifier) {}

  // Verify and apply one operation against the snapshot.
  EvalOutcome evaluate(StateSnapshot& snapshot, const Operation& op) const;

  // Verification only; the snapshot is not modified.
  VerifyResult verify(const StateSnapshot& snapshot, const Operation& op) const;

  // Fold an accepted sequence on top of `from`. Stops at the first failure
  // and reports it; accepted sequences never fail unless tampered with.
  bool replay(StateSnapshot& from, const std::vector<Operation>& ops, std::string* error) const;

 private:
  const Articles& articles_;
  const IVerifier& verifier_;
};

// Read-only projections declared in the articles (e.g. totalVotes).
std::string evaluate_aggregator(const Aggregator& aggregator, const StateSnapshot& snapshot);
std::map<std::string, std::string> aggregate(const Articles& articles, const StateSnapshot& snapshot);
std::optional<std::string> query_aggregator(const Articles& articles, const StateSnapshot& snapshot,
                                            const std::string& name);

jsonlite::Object snapshot_to_object(const StateSnapshot& snapshot);
std::string snapshot_to_json(const StateSnapshot& snapshot);
std::optional<StateSnapshot> snapshot_from_json(const std::string& json, std::string* error);
std::string snapshot_digest(const StateSnapshot& snapshot);

}  // namespace cellstash
