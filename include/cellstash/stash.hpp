#pragma once

// cellstash/stash.hpp — The stash: ordering engine over a partial history.
//
// A Stash holds every operation known to one party for one contract and
// folds the closed part of that set into a deterministic linear order.
//
// DESIGN INVARIANTS (must not be broken):
//   1. DETERMINISM: the accepted order of a set of operations committed in
//      one round depends only on their content. Among ready operations the
//      lexicographically smallest op_id is evaluated first.
//   2. APPEND-ONLY: accepted operations never move. Later arrivals only
//      extend the order.
//   3. NO DOUBLE SPEND: a cell has at most one accepted consumer. Every other
//      consumer is conflicted, and everything built on it is rejected.
//   4. DURABILITY FIRST: an operation is acknowledged only after its
//      operations-log record is durable, and accepted only after its order
//      record is durable.
//   5. HALT ON FATAL: integrity and persistence failures halt the contract.
//      Every later mutation reports contract_halted until a fresh open().
//
// CONCURRENCY:
//   A Stash is single-writer. Concurrent producers go through IngestQueue.
//   Parallel pre-verification (StashConfig::parallel_verify) runs verifier
//   calls on worker threads but applies results in canonical order on the
//   writer thread.

#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "cellstash/articles.hpp"
#include "cellstash/config.hpp"
#include "cellstash/graph.hpp"
#include "cellstash/op_store.hpp"
#include "cellstash/persistence.hpp"
#include "cellstash/state.hpp"
#include "cellstash/types.hpp"
#include "cellstash/verifier.hpp"

namespace cellstash {

struct SubmitReport {
  OpId op_id;
  PutStatus put{PutStatus::malformed};
  OpStatus status{OpStatus::unknown};
  ErrorCode error_code{ErrorCode::none};
  std::string detail;
  std::vector<OpId> missing;  // producers not yet known, when pending
};

struct CommitReport {
  std::vector<OpId> accepted;  // in order
  std::vector<OpId> conflicted;
  std::vector<OpId> rejected;
  std::vector<OpId> evicted;
  ErrorCode error_code{ErrorCode::none};  // fatal errors only
  std::string detail;

  bool ok() const { return error_code == ErrorCode::none; }
};

struct AcceptReport {
  SubmitReport submit;
  CommitReport commit;
  OpStatus status{OpStatus::unknown};  // after the commit
};

struct ImportReport {
  size_t received{0};
  size_t accepted_new{0};
  size_t already_present{0};
  size_t malformed{0};
  CommitReport commit;
};

// Exchange stream: one header line carrying the articles, then one line
// per operation in evaluation order.
struct ExchangeBundle {
  Articles articles;
  std::vector<Operation> operations;
};

bool write_exchange_stream(std::ostream& out, const Articles& articles,
                           const std::vector<Operation>& operations, std::string* error);
bool read_exchange_stream(std::istream& in, ExchangeBundle* out, std::string* error);

class Stash {
 public:
  Stash(Articles articles, std::shared_ptr<IStashPersistence> persistence, StashConfig config = {},
        std::shared_ptr<const IVerifier> verifier = nullptr);

  // Opens a stash whose articles are already stored in `persistence`.
  static std::unique_ptr<Stash> open_existing(std::shared_ptr<IStashPersistence> persistence,
                                              StashConfig config, std::string* error,
                                              std::shared_ptr<const IVerifier> verifier = nullptr);

  Stash(const Stash&) = delete;
  Stash& operator=(const Stash&) = delete;

  // Writes the articles (first open) or checks them, then recovers every
  // durable record: checkpoint, accepted order, unresolved operations.
  bool open(std::string* error);

  // --- Mutation -----------------------------------------------------------
  // Integrity check, durable ingest and classification. Does not order.
  SubmitReport submit(const Operation& op);
  SubmitReport submit_json(const std::string& op_json);
  // Orders every ready operation. Runs retention on the pending pool.
  CommitReport commit();
  AcceptReport accept(const Operation& op);
  // Absorbs every operation another stash of the same contract knows.
  bool merge(const Stash& other, CommitReport* report, std::string* error);
  bool import_bundle(const ExchangeBundle& bundle, ImportReport* report, std::string* error);
  bool import_stream(std::istream& in, ImportReport* report, std::string* error);

  // --- Queries ------------------------------------------------------------
  const Articles& articles() const { return articles_; }
  const std::string& contract_id() const { return articles_.contract_id; }
  const StashConfig& config() const { return config_; }

  OpStatus status(const OpId& op_id) const;
  // Why an op is conflicted, rejected or was evicted. none otherwise.
  ErrorCode reason(const OpId& op_id) const;
  std::string reason_detail(const OpId& op_id) const;

  // Accepted order, genesis first.
  const std::vector<OpId>& order() const { return order_; }
  std::optional<uint64_t> position(const OpId& op_id) const;
  std::vector<OpId> pending() const { return graph_.unresolved(); }
  std::optional<Operation> get(const OpId& op_id) const;
  std::vector<OpId> known() const;

  const StateSnapshot& state() const { return snapshot_; }
  std::string state_digest() const { return snapshot_digest(snapshot_); }
  std::optional<std::string> query(const std::string& aggregator) const;
  std::map<std::string, std::string> aggregates() const { return aggregate(articles_, snapshot_); }

  std::optional<OpId> spent_by(const CellAddr& addr) const { return graph_.spent_by(addr); }
  std::vector<OpId> read_by(const CellAddr& addr) const { return graph_.read_by(addr); }
  std::vector<OpId> missing_producers(const OpId& op_id) const {
    return graph_.missing_producers(op_id);
  }
  const Transition* transition(const OpId& op_id) const;

  // Known transitive producers / consumers, excluding the inputs themselves.
  std::set<OpId> ancestors(const std::vector<OpId>& ops) const;
  std::set<OpId> descendants(const std::vector<OpId>& ops) const;

  // Accepted closure of `terminals` (ancestors plus terminals), in accepted
  // order, genesis first. Fails if a terminal is not accepted.
  std::optional<std::vector<OpId>> subset(const std::vector<OpId>& terminals,
                                          std::string* error) const;

  bool export_subset(const std::vector<OpId>& terminals, std::ostream& out, std::string* error) const;
  // Accepted order followed by unresolved operations.
  bool export_all(std::ostream& out, std::string* error) const;

  bool halted() const { return halted_; }
  ErrorCode halt_code() const { return halt_code_; }
  const std::string& halt_detail() const { return halt_detail_; }

  uint64_t commit_rounds() const { return round_; }

 private:
  void halt(ErrorCode code, const std::string& detail);
  void emit(const std::string& kind, const OpId& op_id, OpStatus status, ErrorCode code,
            const std::string& detail) const;

  // Applies a terminal status plus the cascade, recording reasons.
  void settle_terminal(const OpId& op_id, OpStatus status, ErrorCode code, const std::string& detail,
                       CommitReport* report);
  // Inserts a stored op into the graph and settles terminal outcomes.
  InsertReport classify_new(const Operation& op, CommitReport* report);

  void preverify_frontier(std::map<OpId, VerifyResult>& cache) const;
  bool maybe_checkpoint();
  bool enforce_retention(CommitReport* report);
  bool check_cycles();

  bool recover(const LoadedStash& loaded, std::string* error);

  Articles articles_;
  std::shared_ptr<IStashPersistence> persistence_;
  StashConfig config_;
  std::shared_ptr<const IVerifier> verifier_;

  OperationStore store_;
  DependencyGraph graph_;
  StateSnapshot snapshot_;
  std::vector<OpId> order_;
  std::map<OpId, uint64_t> positions_;
  std::map<OpId, Transition> transitions_;
  std::map<OpId, std::pair<ErrorCode, std::string>> reasons_;

  uint64_t round_{0};
  bool opened_{false};
  bool halted_{false};
  ErrorCode halt_code_{ErrorCode::none};
  std::string halt_detail_;
};

// Evaluation order of an arbitrary set of operations under `articles`, as a
// fresh in-memory stash would commit it in one round. Pure.
struct OrderResult {
  std::vector<OpId> accepted;  // genesis first
  std::vector<OpId> pending;
  std::vector<OpId> conflicted;
  std::vector<OpId> rejected;
  std::vector<OpId> malformed;
  std::string state_digest;
};

OrderResult canonical_order(const Articles& articles, const std::vector<Operation>& ops,
                            std::shared_ptr<const IVerifier> verifier = nullptr);

}  // namespace cellstash
