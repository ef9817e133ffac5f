#include "cellstash/stash.hpp"

#include <algorithm>
#include <deque>
#include <future>
#include <iostream>
#include <thread>

#include "cellstash/observability.hpp"
#include "cellstash/operation.hpp"

namespace cellstash {

namespace {

Articles finalized(Articles a) {
  if (a.contract_id.empty() || a.genesis.op_id.empty()) finalize_articles(a);
  return a;
}

}  // namespace

Stash::Stash(Articles articles, std::shared_ptr<IStashPersistence> persistence, StashConfig config,
             std::shared_ptr<const IVerifier> verifier)
    : articles_(finalized(std::move(articles))),
      persistence_(persistence ? std::move(persistence) : std::make_shared<MemoryPersistence>()),
      config_(std::move(config)),
      verifier_(verifier ? std::move(verifier) : std::make_shared<CapabilityVerifier>()),
      store_(articles_.contract_id, *persistence_) {
  if (!config_.event_log.empty()) set_event_log_path(config_.event_log);

  const OpId& genesis = articles_.genesis_opid();
  snapshot_ = genesis_snapshot(articles_);
  graph_.insert_accepted(articles_.genesis);
  order_.push_back(genesis);
  positions_[genesis] = 0;
  transitions_[genesis] = Transition{genesis, {}};
}

std::unique_ptr<Stash> Stash::open_existing(std::shared_ptr<IStashPersistence> persistence,
                                            StashConfig config, std::string* error,
                                            std::shared_ptr<const IVerifier> verifier) {
  LoadedStash loaded;
  if (!persistence->load(&loaded, error)) return nullptr;
  if (!loaded.articles) {
    if (error) *error = "no articles stored in " + persistence->backend_id() + " persistence";
    return nullptr;
  }
  auto stash = std::make_unique<Stash>(std::move(*loaded.articles), std::move(persistence),
                                       std::move(config), std::move(verifier));
  if (!stash->open(error)) return nullptr;
  return stash;
}

// ---------------------------------------------------------------------------
// Halting and events
// ---------------------------------------------------------------------------

void Stash::halt(ErrorCode code, const std::string& detail) {
  if (halted_) return;
  halted_ = true;
  halt_code_ = code;
  halt_detail_ = detail;
  std::cerr << "[stash] contract " << articles_.contract_id.substr(0, 16) << " halted: "
            << to_string(code) << ": " << detail << "\n";
  emit("halt", "", OpStatus::unknown, code, detail);
}

void Stash::emit(const std::string& kind, const OpId& op_id, OpStatus status, ErrorCode code,
                 const std::string& detail) const {
  StashEvent ev;
  ev.kind = kind;
  ev.contract_id = articles_.contract_id;
  ev.op_id = op_id;
  ev.status = status == OpStatus::unknown ? "" : to_string(status);
  ev.error_code = code == ErrorCode::none ? "" : to_string(code);
  ev.detail = detail;
  auto pos = positions_.find(op_id);
  ev.position = pos == positions_.end() ? snapshot_.position : pos->second;
  emit_stash_event(ev);
}

// ---------------------------------------------------------------------------
// Open / recovery
// ---------------------------------------------------------------------------

bool Stash::open(std::string* error) {
  if (opened_) return true;
  if (halted_) {
    if (error) *error = to_string(ErrorCode::contract_halted) + ": " + halt_detail_;
    return false;
  }

  std::string detail;
  if (!persistence_->write_articles(articles_, &detail)) {
    halt(ErrorCode::persistence_failure, detail);
    if (error) *error = detail;
    return false;
  }

  LoadedStash loaded;
  if (!persistence_->load(&loaded, &detail)) {
    halt(loaded.failure == ErrorCode::none ? ErrorCode::persistence_failure : loaded.failure, detail);
    if (error) *error = detail;
    return false;
  }
  if (loaded.articles && loaded.articles->contract_id != articles_.contract_id) {
    detail = "stored articles belong to contract " + loaded.articles->contract_id;
    halt(ErrorCode::integrity_violation, detail);
    if (error) *error = detail;
    return false;
  }

  opened_ = true;
  if (!recover(loaded, &detail)) {
    halt(ErrorCode::integrity_violation, detail);
    if (error) *error = detail;
    return false;
  }
  if (halted_) {
    if (error) *error = halt_detail_;
    return false;
  }
  return true;
}

bool Stash::recover(const LoadedStash& loaded, std::string* error) {
  auto fail = [&](const std::string& why) {
    if (error) *error = why;
    return false;
  };

  // The operations journal, evictions applied in sequence.
  std::map<OpId, Operation> known;
  std::map<OpId, std::pair<ErrorCode, std::string>> verdicts;
  std::vector<OpId> arrival;
  for (const auto& entry : loaded.journal) {
    if (entry.kind == JournalEntry::Kind::operation) {
      if (known.emplace(entry.op_id, entry.op).second) arrival.push_back(entry.op_id);
    } else if (entry.kind == JournalEntry::Kind::verdict) {
      if (!known.count(entry.op_id)) return fail("verdict for unknown op " + entry.op_id);
      verdicts[entry.op_id] = {entry.code, entry.detail};
    } else {
      known.erase(entry.op_id);
      verdicts.erase(entry.op_id);
      arrival.erase(std::remove(arrival.begin(), arrival.end(), entry.op_id), arrival.end());
      reasons_[entry.op_id] = {ErrorCode::pending_evicted, "evicted before restart"};
    }
  }
  for (const auto& [id, op] : known) {
    std::string why;
    if (check_well_formed(op, articles_.contract_id, &why) != ErrorCode::none) {
      return fail("stored operation " + id + " is malformed: " + why);
    }
  }

  std::vector<const Operation*> accepted;
  accepted.reserve(loaded.order.size());
  for (size_t i = 0; i < loaded.order.size(); ++i) {
    const OrderEntry& e = loaded.order[i];
    if (e.position != i + 1) {
      return fail("order record " + std::to_string(i + 1) + " claims position " +
                  std::to_string(e.position));
    }
    auto it = known.find(e.op_id);
    if (it == known.end()) return fail("accepted op " + e.op_id + " missing from operations log");
    accepted.push_back(&it->second);
  }

  size_t replay_from = 0;
  if (loaded.checkpoint) {
    const CheckpointRecord& cp = *loaded.checkpoint;
    if (cp.position < 1 || cp.position > accepted.size() + 1 || cp.snapshot.position != cp.position) {
      return fail("checkpoint position " + std::to_string(cp.position) + " outside accepted order");
    }
    const OpId& expected = cp.position == 1 ? articles_.genesis_opid() : accepted[cp.position - 2]->op_id;
    if (cp.up_to != expected || cp.snapshot.last_op != expected) {
      return fail("checkpoint covers " + cp.up_to + " but order has " + expected);
    }
    if (snapshot_digest(cp.snapshot) != cp.digest) return fail("checkpoint digest mismatch");
    snapshot_ = cp.snapshot;
    replay_from = static_cast<size_t>(cp.position - 1);
  }

  StateEvaluator evaluator(articles_, *verifier_);
  for (size_t i = 0; i < accepted.size(); ++i) {
    const Operation& op = *accepted[i];
    store_.restore(op);
    if (i < replay_from) {
      transitions_[op.op_id] = Transition{op.op_id, {}};
    } else {
      EvalOutcome r = evaluator.evaluate(snapshot_, op);
      if (!r.ok) {
        return fail("replay of " + op.op_id + " failed: " + to_string(r.error_code) + ": " + r.detail);
      }
      transitions_[op.op_id] = std::move(r.transition);
    }
    graph_.insert_accepted(op);
    order_.push_back(op.op_id);
    positions_[op.op_id] = order_.size() - 1;
  }

  CommitReport scratch;
  for (const auto& id : arrival) {
    if (positions_.count(id)) continue;
    const Operation& op = known.at(id);
    store_.restore(op);
    auto verdict = verdicts.find(id);
    if (verdict == verdicts.end()) {
      classify_new(op, &scratch);
      continue;
    }
    graph_.insert(op, round_);
    settle_terminal(id, OpStatus::rejected, verdict->second.first, verdict->second.second, &scratch);
  }

  StashEvent ev;
  ev.kind = "recover";
  ev.contract_id = articles_.contract_id;
  ev.op_id = snapshot_.last_op;
  ev.position = accepted.size() - replay_from;
  ev.detail = loaded.torn_tail_dropped ? "torn tail dropped" : "";
  emit_stash_event(ev);

  // Operations acknowledged but not yet ordered when the process stopped.
  if (!graph_.ready().empty()) commit();
  return true;
}

// ---------------------------------------------------------------------------
// Submission
// ---------------------------------------------------------------------------

InsertReport Stash::classify_new(const Operation& op, CommitReport* report) {
  InsertReport r = graph_.insert(op, round_);
  if (r.status == OpStatus::conflicted || r.status == OpStatus::rejected) {
    settle_terminal(op.op_id, r.status, r.error_code, r.detail, report);
  }
  return r;
}

void Stash::settle_terminal(const OpId& op_id, OpStatus status, ErrorCode code,
                            const std::string& detail, CommitReport* report) {
  const std::vector<OpId> cascaded = graph_.mark_terminal(op_id, status);
  reasons_[op_id] = {code, detail};
  if (report) (status == OpStatus::conflicted ? report->conflicted : report->rejected).push_back(op_id);
  emit(status == OpStatus::conflicted ? "conflict" : "reject", op_id, status, code, detail);

  const std::string why = "ancestor " + op_id + " is " + to_string(status);
  for (const auto& child : cascaded) {
    reasons_[child] = {ErrorCode::rejected_ancestor, why};
    if (report) report->rejected.push_back(child);
    emit("reject", child, OpStatus::rejected, ErrorCode::rejected_ancestor, why);
  }
}

SubmitReport Stash::submit(const Operation& op) {
  SubmitReport r;
  r.op_id = op.op_id;
  if (!opened_ && !halted_) open(nullptr);
  if (halted_) {
    r.error_code = ErrorCode::contract_halted;
    r.detail = halt_detail_;
    return r;
  }

  if (op.op_id == articles_.genesis_opid()) {
    r.put = PutStatus::already_present;
    r.status = OpStatus::accepted;
    emit("submit", op.op_id, r.status, ErrorCode::none, "");
    return r;
  }

  const PutResult put = store_.put(op);
  if (put.error_code == ErrorCode::persistence_failure) {
    halt(ErrorCode::persistence_failure, put.detail);
    r.error_code = ErrorCode::persistence_failure;
    r.detail = put.detail;
    return r;
  }
  r.put = put.status;
  if (put.status == PutStatus::malformed) {
    r.error_code = put.error_code;
    r.detail = put.detail;
    StashEvent ev;
    ev.kind = "submit";
    ev.contract_id = articles_.contract_id;
    ev.op_id = op.op_id;
    ev.status = to_string(PutStatus::malformed);
    ev.error_code = to_string(put.error_code);
    ev.detail = put.detail;
    emit_stash_event(ev);
    return r;
  }
  if (put.status == PutStatus::already_present) {
    r.status = status(op.op_id);
    r.error_code = reason(op.op_id);
    StashEvent ev;
    ev.kind = "submit";
    ev.contract_id = articles_.contract_id;
    ev.op_id = op.op_id;
    ev.status = to_string(PutStatus::already_present);
    emit_stash_event(ev);
    return r;
  }

  reasons_.erase(op.op_id);
  const InsertReport ins = classify_new(op, nullptr);
  r.status = graph_.status(op.op_id);
  r.error_code = ins.error_code;
  r.detail = ins.detail;
  if (r.status == OpStatus::pending) r.missing = graph_.missing_producers(op.op_id);
  emit("submit", op.op_id, r.status, ErrorCode::none, "");
  return r;
}

SubmitReport Stash::submit_json(const std::string& op_json) {
  if (auto err = jsonlite::validate_strict(op_json)) {
    SubmitReport r;
    r.put = PutStatus::malformed;
    r.error_code = err->code == "json_duplicate_key" ? ErrorCode::json_duplicate_key
                                                     : ErrorCode::json_parse_error;
    r.detail = err->message;
    return r;
  }
  std::string error;
  auto op = parse_operation_json(op_json, &error);
  if (!op) {
    SubmitReport r;
    r.put = PutStatus::malformed;
    r.error_code = ErrorCode::malformed_operation;
    r.detail = error;
    return r;
  }
  return submit(*op);
}

// ---------------------------------------------------------------------------
// Ordering
// ---------------------------------------------------------------------------

void Stash::preverify_frontier(std::map<OpId, VerifyResult>& cache) const {
  std::vector<const Operation*> todo;
  for (const auto& id : graph_.ready()) {
    if (cache.count(id)) continue;
    if (const Operation* op = store_.find(id)) todo.push_back(op);
  }
  if (todo.size() < 2) return;

  size_t workers = config_.verify_threads;
  if (workers == 0) workers = std::max<size_t>(1, std::thread::hardware_concurrency());

  const StateEvaluator evaluator(articles_, *verifier_);
  for (size_t begin = 0; begin < todo.size(); begin += workers) {
    const size_t end = std::min(todo.size(), begin + workers);
    std::vector<std::future<VerifyResult>> futures;
    futures.reserve(end - begin);
    for (size_t i = begin; i < end; ++i) {
      const Operation* op = todo[i];
      futures.push_back(std::async(std::launch::async,
                                   [&evaluator, this, op] { return evaluator.verify(snapshot_, *op); }));
    }
    for (size_t i = begin; i < end; ++i) cache[todo[i]->op_id] = futures[i - begin].get();
  }
}

CommitReport Stash::commit() {
  CommitReport report;
  if (!opened_ && !halted_) open(nullptr);
  if (halted_) {
    report.error_code = ErrorCode::contract_halted;
    report.detail = halt_detail_;
    return report;
  }

  ScopeTimer timer(global_stash_stats().commit_latency);
  ++round_;

  const StateEvaluator evaluator(articles_, *verifier_);
  std::map<OpId, VerifyResult> cache;
  auto fatal = [&](ErrorCode code, const std::string& detail) {
    halt(code, detail);
    report.error_code = code;
    report.detail = detail;
    return report;
  };

  while (!graph_.ready().empty()) {
    if (config_.parallel_verify) preverify_frontier(cache);

    const OpId id = *graph_.ready().begin();
    const Operation* op = store_.find(id);
    if (!op) return fatal(ErrorCode::integrity_violation, "ready op missing from store: " + id);

    VerifyResult v;
    auto cached = cache.find(id);
    if (cached != cache.end()) {
      v = std::move(cached->second);
      cache.erase(cached);
    } else {
      v = evaluator.verify(snapshot_, *op);
    }
    std::string error;
    if (!v.ok) {
      // Later accepts change the state this verdict was reached against, so
      // recovery must not re-derive it.
      if (!persistence_->append_verdict(id, ErrorCode::verification_failure, v.detail, &error)) {
        return fatal(ErrorCode::persistence_failure, error);
      }
      settle_terminal(id, OpStatus::rejected, ErrorCode::verification_failure, v.detail, &report);
      continue;
    }

    if (!persistence_->append_order(OrderEntry{id, order_.size()}, &error)) {
      return fatal(ErrorCode::persistence_failure, error);
    }
    transitions_[id] = apply(snapshot_, *op, v);
    order_.push_back(id);
    positions_[id] = order_.size() - 1;
    reasons_.erase(id);

    const AcceptEffects fx = graph_.mark_accepted(id);
    report.accepted.push_back(id);
    emit("accept", id, OpStatus::accepted, ErrorCode::none, "");
    for (const auto& loser : fx.conflicted) {
      if (graph_.status(loser) != OpStatus::pending && graph_.status(loser) != OpStatus::ready) continue;
      settle_terminal(loser, OpStatus::conflicted, ErrorCode::conflicting_consumption,
                      "input already consumed by " + id, &report);
    }
    if (!maybe_checkpoint()) {
      report.error_code = halt_code_;
      report.detail = halt_detail_;
      return report;
    }
  }

  if (!check_cycles() || !enforce_retention(&report)) {
    report.error_code = halt_code_;
    report.detail = halt_detail_;
  }
  return report;
}

AcceptReport Stash::accept(const Operation& op) {
  AcceptReport r;
  r.submit = submit(op);
  if (r.submit.put == PutStatus::malformed || r.submit.error_code == ErrorCode::contract_halted) {
    r.status = r.submit.status;
    return r;
  }
  r.commit = commit();
  r.status = status(op.op_id);
  return r;
}

bool Stash::maybe_checkpoint() {
  if (config_.checkpoint_interval == 0) return true;
  const uint64_t accepted = snapshot_.position - 1;
  if (accepted == 0 || accepted % config_.checkpoint_interval != 0) return true;
  std::string error;
  if (!persistence_->checkpoint(snapshot_, snapshot_.last_op, &error)) {
    halt(ErrorCode::persistence_failure, "checkpoint failed: " + error);
    return false;
  }
  emit("checkpoint", snapshot_.last_op, OpStatus::accepted, ErrorCode::none, "");
  return true;
}

bool Stash::check_cycles() {
  // A pending op with every producer known can only be waiting on other
  // pending ops. Unless one of those waits on a missing producer, the
  // known set contains a cycle.
  bool suspicious = false;
  for (const auto& id : graph_.unresolved()) {
    if (graph_.missing_producers(id).empty()) {
      suspicious = true;
      break;
    }
  }
  if (!suspicious) return true;
  auto cycle = graph_.find_cycle();
  if (!cycle) return true;
  std::string path;
  for (const auto& id : *cycle) {
    if (!path.empty()) path += " -> ";
    path += id.substr(0, 12);
  }
  halt(ErrorCode::integrity_violation, "dependency cycle: " + path);
  return false;
}

bool Stash::enforce_retention(CommitReport* report) {
  std::vector<OpId> pending = graph_.pending_by_arrival();
  std::vector<std::pair<OpId, std::string>> victims;
  std::vector<OpId> survivors;
  for (const auto& id : pending) {
    if (config_.pending_ttl_commits > 0 && round_ - graph_.arrival_round(id) >= config_.pending_ttl_commits) {
      victims.emplace_back(id, "unresolved for " + std::to_string(config_.pending_ttl_commits) +
                                   " commit rounds");
    } else {
      survivors.push_back(id);
    }
  }
  if (config_.pending_max > 0 && survivors.size() > config_.pending_max) {
    const size_t excess = survivors.size() - static_cast<size_t>(config_.pending_max);
    for (size_t i = 0; i < excess; ++i) {
      victims.emplace_back(survivors[i], "pending pool over " + std::to_string(config_.pending_max));
    }
  }

  for (const auto& [id, why] : victims) {
    std::string error;
    if (!persistence_->append_eviction(id, why, &error)) {
      halt(ErrorCode::persistence_failure, error);
      return false;
    }
    graph_.remove(id);
    store_.erase(id);
    reasons_[id] = {ErrorCode::pending_evicted, why};
    report->evicted.push_back(id);
    emit("evict", id, OpStatus::unknown, ErrorCode::pending_evicted, why);
  }
  return true;
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

OpStatus Stash::status(const OpId& op_id) const { return graph_.status(op_id); }

ErrorCode Stash::reason(const OpId& op_id) const {
  auto it = reasons_.find(op_id);
  return it == reasons_.end() ? ErrorCode::none : it->second.first;
}

std::string Stash::reason_detail(const OpId& op_id) const {
  auto it = reasons_.find(op_id);
  return it == reasons_.end() ? std::string() : it->second.second;
}

std::optional<uint64_t> Stash::position(const OpId& op_id) const {
  auto it = positions_.find(op_id);
  if (it == positions_.end()) return std::nullopt;
  return it->second;
}

std::optional<Operation> Stash::get(const OpId& op_id) const {
  if (op_id == articles_.genesis_opid()) return articles_.genesis;
  return store_.get(op_id);
}

std::vector<OpId> Stash::known() const {
  std::vector<OpId> out = store_.ids();
  out.insert(std::lower_bound(out.begin(), out.end(), articles_.genesis_opid()), articles_.genesis_opid());
  return out;
}

std::optional<std::string> Stash::query(const std::string& aggregator) const {
  return query_aggregator(articles_, snapshot_, aggregator);
}

const Transition* Stash::transition(const OpId& op_id) const {
  auto it = transitions_.find(op_id);
  return it == transitions_.end() ? nullptr : &it->second;
}

std::set<OpId> Stash::ancestors(const std::vector<OpId>& ops) const {
  std::set<OpId> seen;
  std::deque<OpId> work(ops.begin(), ops.end());
  while (!work.empty()) {
    const OpId cur = work.front();
    work.pop_front();
    for (const auto& parent : graph_.producers(cur)) {
      if (!graph_.contains(parent) || !seen.insert(parent).second) continue;
      work.push_back(parent);
    }
  }
  for (const auto& id : ops) seen.erase(id);
  return seen;
}

std::set<OpId> Stash::descendants(const std::vector<OpId>& ops) const {
  std::set<OpId> seen;
  std::deque<OpId> work(ops.begin(), ops.end());
  while (!work.empty()) {
    const OpId cur = work.front();
    work.pop_front();
    for (const auto& child : graph_.dependents(cur)) {
      if (seen.insert(child).second) work.push_back(child);
    }
  }
  for (const auto& id : ops) seen.erase(id);
  return seen;
}

std::optional<std::vector<OpId>> Stash::subset(const std::vector<OpId>& terminals,
                                               std::string* error) const {
  for (const auto& id : terminals) {
    if (status(id) != OpStatus::accepted) {
      if (error) *error = "not accepted: " + id;
      return std::nullopt;
    }
  }
  std::set<OpId> closure = ancestors(terminals);
  closure.insert(terminals.begin(), terminals.end());
  closure.insert(articles_.genesis_opid());

  std::vector<OpId> out;
  out.reserve(closure.size());
  for (const auto& id : order_) {
    if (closure.count(id)) out.push_back(id);
  }
  return out;
}

// ---------------------------------------------------------------------------
// Canonical order (pure)
// ---------------------------------------------------------------------------

OrderResult canonical_order(const Articles& articles, const std::vector<Operation>& ops,
                            std::shared_ptr<const IVerifier> verifier) {
  StashConfig cfg;
  cfg.checkpoint_interval = 0;
  cfg.pending_max = 0;
  cfg.pending_ttl_commits = 0;
  Stash stash(articles, std::make_shared<MemoryPersistence>(), cfg, std::move(verifier));

  OrderResult out;
  if (!stash.open(nullptr)) return out;
  for (const auto& op : ops) {
    if (stash.submit(op).put == PutStatus::malformed) out.malformed.push_back(op.op_id);
  }
  stash.commit();

  out.accepted = stash.order();
  out.pending = stash.pending();
  for (const auto& id : stash.known()) {
    const OpStatus s = stash.status(id);
    if (s == OpStatus::conflicted) out.conflicted.push_back(id);
    if (s == OpStatus::rejected) out.rejected.push_back(id);
  }
  out.state_digest = stash.state_digest();
  return out;
}

}  // namespace cellstash
