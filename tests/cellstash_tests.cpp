#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "cellstash/append_log.hpp"
#include "cellstash/articles.hpp"
#include "cellstash/blob_store.hpp"
#include "cellstash/capability.hpp"
#include "cellstash/config.hpp"
#include "cellstash/graph.hpp"
#include "cellstash/hash.hpp"
#include "cellstash/ingest.hpp"
#include "cellstash/jsonlite.hpp"
#include "cellstash/observability.hpp"
#include "cellstash/operation.hpp"
#include "cellstash/persistence.hpp"
#include "cellstash/stash.hpp"
#include "cellstash/state.hpp"
#include "cellstash/version.hpp"

namespace fs = std::filesystem;
using namespace cellstash;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

fs::path fresh_dir(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() / ("cellstash_test_" + name);
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

const std::string kSecret1 = "signer-one-secret";
const std::string kSecret2 = "signer-two-secret";
const std::string kSecret3 = "signer-three-secret";

// A ballot contract: three signer cells in genesis, each may cast one vote.
// "relay" passes a used ballot on, which gives tests dependency chains.
Articles vote_articles(const std::string& name = "ballot") {
  Articles a;
  a.name = name;
  a.version = 1;
  a.timestamp = 1700000000;
  a.methods["castVote"] = MethodRule{"castVote", {"signer"}, {}, {"used"}, {"vote"}};
  a.methods["relay"] = MethodRule{"relay", {"used"}, {"topic"}, {"used"}, {}};
  a.genesis_owned = {
      OwnedOutput{"signer", auth_token(kSecret1), "1"},
      OwnedOutput{"signer", auth_token(kSecret2), "1"},
      OwnedOutput{"signer", auth_token(kSecret3), "1"},
  };
  a.genesis_global = {GlobalOutput{"topic", "budget-2026"}};
  a.aggregators = {
      Aggregator{"totalVotes", AggregatorKind::count, "vote", ""},
      Aggregator{"proVotes", AggregatorKind::count_eq, "vote", "pro"},
      Aggregator{"counterVotes", AggregatorKind::count_eq, "vote", "counter"},
  };
  finalize_articles(a);
  return a;
}

Operation cast_vote(const Articles& a, uint32_t signer, const std::string& secret,
                    const std::string& vote, uint64_t nonce = 1) {
  Operation op;
  op.contract_id = a.contract_id;
  op.method = "castVote";
  op.nonce = nonce;
  op.consumed = {Input{owned_addr(a.genesis, signer), secret}};
  op.owned_out = {OwnedOutput{"used", auth_token(secret), vote}};
  op.global_out = {GlobalOutput{"vote", vote}};
  seal(op);
  return op;
}

Operation relay(const Articles& a, const Operation& parent, const std::string& secret,
                uint64_t nonce = 1) {
  Operation op;
  op.contract_id = a.contract_id;
  op.method = "relay";
  op.nonce = nonce;
  op.consumed = {Input{owned_addr(parent, 0), secret}};
  op.reading = {global_addr(a.genesis, 0)};
  op.owned_out = {OwnedOutput{"used", auth_token(secret), "relayed"}};
  seal(op);
  return op;
}

std::shared_ptr<MemoryPersistence> memory() { return std::make_shared<MemoryPersistence>(); }

StashConfig quiet_config() {
  StashConfig c;
  c.pending_max = 0;
  c.pending_ttl_commits = 0;
  return c;
}

// ============================================================================
// Commitments
// ============================================================================

void test_blake3_known_vectors() {
  expect(blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  const std::string payload = "same bytes";
  expect(operation_commitment(payload) != articles_commitment(payload), "op vs articles domain");
  expect(operation_commitment(payload) != snapshot_commitment(payload), "op vs snapshot domain");
  expect(auth_token(payload) != operation_commitment(payload), "auth vs op domain");
  expect(is_hex_digest(auth_token("x")), "auth token is a digest");
  expect(!is_hex_digest("xyz"), "short string is not a digest");
}

void test_op_id_commits_to_content() {
  const Articles a = vote_articles();
  Operation op = cast_vote(a, 0, kSecret1, "pro");
  expect(op.op_id == compute_op_id(op), "sealed op_id matches commitment");
  expect(check_well_formed(op, a.contract_id, nullptr) == ErrorCode::none, "sealed op well formed");

  Operation changed = op;
  changed.global_out[0].value = "counter";
  expect(compute_op_id(changed) != op.op_id, "changing a value changes op_id");
  std::string why;
  expect(check_well_formed(changed, a.contract_id, &why) == ErrorCode::malformed_operation,
         "stale op_id is malformed");

  Operation reordered = op;
  reordered.nonce = 2;
  expect(compute_op_id(reordered) != op.op_id, "nonce is committed");

  expect(check_well_formed(op, "other-contract", nullptr) == ErrorCode::contract_mismatch,
         "foreign contract id");
}

void test_articles_json_roundtrip() {
  const Articles a = vote_articles();
  std::string error;
  auto parsed = parse_articles_json(articles_to_json(a), &error);
  expect(parsed.has_value(), "articles parse: " + error);
  expect(parsed->contract_id == a.contract_id, "contract id survives serialization");
  expect(parsed->genesis_opid() == a.genesis_opid(), "genesis op id survives serialization");
  expect(vote_articles("other").contract_id != a.contract_id, "name is committed");

  std::string bad = articles_to_json(a);
  bad.replace(bad.find("count_eq"), 8, "count_xx");
  expect(!parse_articles_json(bad, &error).has_value(), "unknown aggregator kind rejected");
}

void test_json_surrogate_pairs() {
  std::optional<jsonlite::JsonError> err;
  const auto escaped = jsonlite::parse("{\"v\":\"\\uD83D\\uDE00\"}", &err);
  expect(!err, "surrogate pair parses");
  const std::string smiley = "\xF0\x9F\x98\x80";
  expect(jsonlite::get_string(escaped, "v") == smiley, "surrogate pair decodes to one code point");

  const auto raw = jsonlite::parse("{\"v\":\"" + smiley + "\"}", &err);
  expect(!err, "raw UTF-8 parses");
  expect(jsonlite::serialize(escaped) == jsonlite::serialize(raw), "both spellings canonicalize identically");

  const auto bmp = jsonlite::parse("{\"v\":\"\\u00e9\"}", &err);
  expect(!err && jsonlite::get_string(bmp, "v") == "\xC3\xA9", "BMP escape decodes");

  jsonlite::parse("{\"v\":\"\\uD83Dx\"}", &err);
  expect(err.has_value(), "lone high surrogate refused");
  jsonlite::parse("{\"v\":\"\\uDE00\"}", &err);
  expect(err.has_value(), "lone low surrogate refused");
  jsonlite::parse("{\"v\":\"\\uD83D\\u0041\"}", &err);
  expect(err.has_value(), "high surrogate followed by non-surrogate refused");
}

// ============================================================================
// Capabilities and state
// ============================================================================

void test_capability_check() {
  const Articles a = vote_articles();
  const StateSnapshot genesis = genesis_snapshot(a);
  const Cell* signer = genesis.find_owned(owned_addr(a.genesis, 0));
  expect(signer != nullptr, "genesis signer cell is live");
  expect(check_capability(*signer, kSecret1, a) == CapabilityDecision::admit, "right secret admitted");
  expect(check_capability(*signer, kSecret2, a) == CapabilityDecision::reject, "wrong secret rejected");

  Cell forged = *signer;
  forged.owner = "not-hex";
  expect(check_capability(forged, kSecret1, a) == CapabilityDecision::reject, "non-hex owner rejected");
}

void test_genesis_snapshot() {
  const Articles a = vote_articles();
  const StateSnapshot s = genesis_snapshot(a);
  expect(s.position == 1, "genesis snapshot counts genesis");
  expect(s.last_op == a.genesis_opid(), "genesis is last op");
  expect(s.owned.size() == 3, "three signer cells");
  expect(s.global.size() == 1, "one topic cell");
  expect(s.cells_owned_by(auth_token(kSecret2)).size() == 1, "owner index");
  expect(snapshot_digest(s) == snapshot_digest(genesis_snapshot(a)), "genesis digest is stable");
}

void test_snapshot_json_roundtrip() {
  const Articles a = vote_articles();
  StateSnapshot s = genesis_snapshot(a);
  CapabilityVerifier verifier;
  StateEvaluator evaluator(a, verifier);
  std::string error;
  expect(evaluator.replay(s, {cast_vote(a, 0, kSecret1, "pro")}, &error), "replay: " + error);

  auto back = snapshot_from_json(snapshot_to_json(s), &error);
  expect(back.has_value(), "snapshot parse: " + error);
  expect(*back == s, "snapshot survives serialization");
  expect(snapshot_digest(*back) == snapshot_digest(s), "digest survives serialization");
}

void test_sum_aggregator_saturates() {
  StateSnapshot s;
  const OpId producer(64, 'e');
  s.global[CellAddr{producer, 0}] = GlobalCell{CellAddr{producer, 0}, "amount", "18446744073709551615"};
  s.global[CellAddr{producer, 1}] = GlobalCell{CellAddr{producer, 1}, "amount", "5"};
  s.global[CellAddr{producer, 2}] = GlobalCell{CellAddr{producer, 2}, "amount", "abc"};
  const Aggregator total{"total", AggregatorKind::sum, "amount", ""};
  expect(evaluate_aggregator(total, s) == "18446744073709551615", "sum saturates instead of wrapping");

  s.global.erase(CellAddr{producer, 0});
  expect(evaluate_aggregator(total, s) == "5", "non-numeric values skipped");
}

// ============================================================================
// Ordering
// ============================================================================

void test_vote_scenario() {
  const Articles a = vote_articles();
  Stash stash(a, memory(), quiet_config());
  std::string error;
  expect(stash.open(&error), "open: " + error);

  const Operation vote = cast_vote(a, 0, kSecret1, "pro");
  AcceptReport r = stash.accept(vote);
  expect(r.submit.put == PutStatus::accepted_new, "vote is new");
  expect(r.status == OpStatus::accepted, "vote accepted");
  expect(stash.position(vote.op_id) == 1u, "vote follows genesis");
  expect(stash.query("totalVotes") == std::string("1"), "total 1");
  expect(stash.query("proVotes") == std::string("1"), "pro 1");
  expect(stash.query("counterVotes") == std::string("0"), "counter 0");
  expect(!stash.query("noSuchAggregator").has_value(), "unknown aggregator");

  AcceptReport dup = stash.accept(vote);
  expect(dup.submit.put == PutStatus::already_present, "duplicate is already_present");
  expect(dup.status == OpStatus::accepted, "duplicate keeps status");
  expect(stash.order().size() == 2, "duplicate does not extend order");

  const Operation second = cast_vote(a, 0, kSecret1, "counter");
  AcceptReport c = stash.accept(second);
  expect(c.submit.status == OpStatus::conflicted, "second vote by same signer conflicts");
  expect(stash.reason(second.op_id) == ErrorCode::conflicting_consumption, "conflict reason");
  expect(stash.spent_by(owned_addr(a.genesis, 0)) == vote.op_id, "cell spent by first vote");
  expect(stash.query("counterVotes") == std::string("0"), "conflicted vote has no effect");
}

void test_genesis_submission() {
  const Articles a = vote_articles();
  Stash stash(a, memory(), quiet_config());
  SubmitReport r = stash.submit(a.genesis);
  expect(r.put == PutStatus::already_present, "genesis is always present");
  expect(r.status == OpStatus::accepted, "genesis is accepted");
  expect(stash.order().size() == 1 && stash.order()[0] == a.genesis_opid(), "genesis heads the order");
}

void test_unresolved_dependency() {
  const Articles a = vote_articles();
  Stash stash(a, memory(), quiet_config());
  const Operation v = cast_vote(a, 0, kSecret1, "pro");
  const Operation r1 = relay(a, v, kSecret1);
  const Operation r2 = relay(a, r1, kSecret1);

  SubmitReport s2 = stash.submit(r2);
  expect(s2.status == OpStatus::pending, "grandchild waits");
  expect(s2.error_code == ErrorCode::unresolved_dependency, "pending reason");
  expect(s2.missing.size() == 1 && s2.missing[0] == r1.op_id, "missing producer reported");

  expect(stash.submit(r1).status == OpStatus::pending, "child waits");
  expect(stash.commit().accepted.empty(), "nothing ready yet");
  expect(stash.pending().size() == 2, "two pending");

  expect(stash.submit(v).status == OpStatus::ready, "root is ready");
  CommitReport c = stash.commit();
  expect(c.ok(), "commit ok");
  expect(c.accepted == std::vector<OpId>({v.op_id, r1.op_id, r2.op_id}), "topological order");
  expect(stash.pending().empty(), "nothing pending");
  expect(stash.ancestors({r2.op_id}).count(v.op_id) == 1, "ancestors reach the root");
  expect(stash.descendants({v.op_id}).count(r2.op_id) == 1, "descendants reach the leaf");
  expect(stash.read_by(global_addr(a.genesis, 0)).size() == 2, "both relays read the topic");
}

void test_smallest_op_id_first() {
  const Articles a = vote_articles();
  const Operation v1 = cast_vote(a, 0, kSecret1, "pro");
  const Operation v2 = cast_vote(a, 1, kSecret2, "counter");
  const Operation v3 = cast_vote(a, 2, kSecret3, "pro");
  const OrderResult r = canonical_order(a, {v3, v1, v2});
  std::vector<OpId> expected = {v1.op_id, v2.op_id, v3.op_id};
  std::sort(expected.begin(), expected.end());
  expected.insert(expected.begin(), a.genesis_opid());
  expect(r.accepted == expected, "independent ops ordered by op_id");
}

void test_order_independent_of_arrival() {
  const Articles a = vote_articles();
  const Operation v1 = cast_vote(a, 0, kSecret1, "pro");
  const Operation v1b = cast_vote(a, 0, kSecret1, "counter", 2);
  const Operation r1 = relay(a, v1, kSecret1);
  const Operation rb = relay(a, v1b, kSecret1);
  const Operation v2 = cast_vote(a, 1, kSecret2, "counter");

  std::vector<Operation> ops = {v1, v1b, r1, rb, v2};
  std::sort(ops.begin(), ops.end(), [](const Operation& x, const Operation& y) { return x.op_id < y.op_id; });
  const OrderResult base = canonical_order(a, ops);
  int permutations = 0;
  do {
    const OrderResult r = canonical_order(a, ops);
    expect(r.accepted == base.accepted, "accepted order independent of arrival");
    expect(r.state_digest == base.state_digest, "state independent of arrival");
    expect(r.conflicted == base.conflicted, "conflicts independent of arrival");
    ++permutations;
  } while (std::next_permutation(ops.begin(), ops.end(),
                                 [](const Operation& x, const Operation& y) { return x.op_id < y.op_id; }) &&
           permutations < 40);

  expect(base.conflicted.size() == 1, "one of the double votes loses");
  expect(base.rejected.size() == 1, "the loser's child is rejected");
}

void test_conflict_cascade() {
  const Articles a = vote_articles();
  const Operation x = cast_vote(a, 0, kSecret1, "pro");
  const Operation y = cast_vote(a, 0, kSecret1, "counter", 7);
  const Operation& winner = x.op_id < y.op_id ? x : y;
  const Operation& loser = x.op_id < y.op_id ? y : x;
  const Operation child = relay(a, loser, kSecret1);

  Stash stash(a, memory(), quiet_config());
  stash.submit(child);
  stash.submit(x);
  stash.submit(y);
  CommitReport c = stash.commit();
  expect(c.accepted == std::vector<OpId>({winner.op_id}), "smallest double spend wins");
  expect(stash.status(loser.op_id) == OpStatus::conflicted, "loser conflicted");
  expect(stash.status(child.op_id) == OpStatus::rejected, "loser's child rejected");
  expect(stash.reason(child.op_id) == ErrorCode::rejected_ancestor, "cascade reason");

  // Late descendants of a terminal op are rejected on arrival.
  const Operation grandchild = relay(a, child, kSecret1);
  SubmitReport g = stash.submit(grandchild);
  expect(g.status == OpStatus::rejected, "late descendant rejected");
  expect(g.error_code == ErrorCode::rejected_ancestor, "late descendant reason");
}

void test_verification_failure() {
  const Articles a = vote_articles();
  Stash stash(a, memory(), quiet_config());
  const Operation forged = cast_vote(a, 1, kSecret1, "pro");  // signer 1 belongs to kSecret2
  AcceptReport r = stash.accept(forged);
  expect(r.status == OpStatus::rejected, "wrong witness rejected");
  expect(stash.reason(forged.op_id) == ErrorCode::verification_failure, "verification reason");
  expect(!stash.spent_by(owned_addr(a.genesis, 1)).has_value(), "cell stays unspent");

  Operation undeclared;
  undeclared.contract_id = a.contract_id;
  undeclared.method = "tally";
  undeclared.nonce = 1;
  undeclared.global_out = {GlobalOutput{"vote", "pro"}};
  seal(undeclared);
  expect(stash.accept(undeclared).status == OpStatus::rejected, "undeclared method rejected");

  // Signer 1 may still vote with the right secret.
  expect(stash.accept(cast_vote(a, 1, kSecret2, "pro")).status == OpStatus::accepted,
         "honest vote still accepted");
}

void test_malformed_input() {
  const Articles a = vote_articles();
  Stash stash(a, memory(), quiet_config());
  const Operation v = cast_vote(a, 0, kSecret1, "pro");
  std::string json = operation_to_json(v);
  const size_t at = json.find("\"pro\"");
  expect(at != std::string::npos, "value present in JSON");
  json[at + 3] = 'x';

  SubmitReport r = stash.submit_json(json);
  expect(r.put == PutStatus::malformed, "mutated byte is malformed");
  expect(r.error_code == ErrorCode::malformed_operation, "commitment mismatch reported");
  expect(stash.known().size() == 1, "nothing stored");

  SubmitReport dup = stash.submit_json("{\"method\":\"a\",\"method\":\"b\"}");
  expect(dup.error_code == ErrorCode::json_duplicate_key, "duplicate key rejected");
  SubmitReport bad = stash.submit_json("{not json");
  expect(bad.error_code == ErrorCode::json_parse_error, "parse error reported");

  SubmitReport ok = stash.submit_json(operation_to_json(v));
  expect(ok.put == PutStatus::accepted_new, "pristine JSON accepted");
}

void test_append_only_stability() {
  const Articles a = vote_articles();
  Stash stash(a, memory(), quiet_config());
  const Operation v1 = cast_vote(a, 0, kSecret1, "pro");
  stash.accept(v1);
  const std::vector<OpId> before = stash.order();

  const Operation v2 = cast_vote(a, 1, kSecret2, "counter");
  const Operation r1 = relay(a, v1, kSecret1);
  stash.submit(v2);
  stash.submit(r1);
  stash.commit();
  const std::vector<OpId>& after = stash.order();
  expect(after.size() == 4, "order extended");
  expect(std::equal(before.begin(), before.end(), after.begin()), "accepted prefix never moves");

  const Transition* t = stash.transition(r1.op_id);
  expect(t != nullptr && t->destroyed.size() == 1, "relay transition destroys one cell");
  expect(t->destroyed.count(owned_addr(v1, 0)) == 1, "relay destroys the used ballot");
}

void test_parallel_verify_same_order() {
  const Articles a = vote_articles();
  std::vector<Operation> ops = {cast_vote(a, 0, kSecret1, "pro"), cast_vote(a, 1, kSecret2, "counter"),
                                cast_vote(a, 2, kSecret3, "pro"), cast_vote(a, 2, kSecret3, "counter", 9)};
  ops.push_back(relay(a, ops[0], kSecret1));
  ops.push_back(relay(a, ops[1], kSecret2));

  StashConfig parallel = quiet_config();
  parallel.parallel_verify = true;
  parallel.verify_threads = 3;
  Stash p(a, memory(), parallel);
  Stash s(a, memory(), quiet_config());
  for (const auto& op : ops) {
    p.submit(op);
    s.submit(op);
  }
  expect(p.commit().ok() && s.commit().ok(), "commits ok");
  expect(p.order() == s.order(), "parallel verification keeps canonical order");
  expect(p.state_digest() == s.state_digest(), "parallel verification keeps state");
}

// ============================================================================
// Dependency graph
// ============================================================================

void test_graph_cycle_detection() {
  const OpId ida(64, 'a');
  const OpId idb(64, 'b');
  const OpId idc(64, 'c');
  Operation x;
  x.op_id = ida;
  x.reading = {CellAddr{idb, 0}};
  Operation y;
  y.op_id = idb;
  y.reading = {CellAddr{ida, 0}};
  Operation z;
  z.op_id = idc;
  z.reading = {CellAddr{std::string(64, 'd'), 0}};

  DependencyGraph g;
  g.insert(z, 0);
  expect(!g.find_cycle().has_value(), "a lone waiting op is no cycle");
  expect(g.insert(x, 0).status == OpStatus::pending, "x waits on y");
  expect(g.insert(y, 0).status == OpStatus::pending, "y waits on x");
  auto cycle = g.find_cycle();
  expect(cycle.has_value(), "cycle found");
  expect(std::find(cycle->begin(), cycle->end(), ida) != cycle->end() &&
             std::find(cycle->begin(), cycle->end(), idb) != cycle->end(),
         "cycle names both ops");
  expect(g.missing_producers(idc).size() == 1, "z has a missing producer");
  expect(g.remove(ida), "remove pending op");
  expect(!g.find_cycle().has_value(), "cycle broken by removal");
}

void test_graph_conflict_on_accept() {
  const OpId root(64, '1');
  const OpId left(64, '2');
  const OpId right(64, '3');
  Operation r;
  r.op_id = root;
  Operation l;
  l.op_id = left;
  l.consumed = {Input{CellAddr{root, 0}, ""}};
  Operation rr;
  rr.op_id = right;
  rr.consumed = {Input{CellAddr{root, 0}, ""}};

  DependencyGraph g;
  g.insert_accepted(r);
  expect(g.insert(l, 0).status == OpStatus::ready, "left ready");
  expect(g.insert(rr, 0).status == OpStatus::ready, "right ready");
  expect(g.consumers(CellAddr{root, 0}).size() == 2, "two consumers indexed");
  AcceptEffects fx = g.mark_accepted(left);
  expect(fx.conflicted == std::vector<OpId>({right}), "competitor reported");
  expect(g.spent_by(CellAddr{root, 0}) == left, "cell spent");
  g.mark_terminal(right, OpStatus::conflicted);
  expect(g.ready().empty(), "ready set drained");
}

// ============================================================================
// Persistence and recovery
// ============================================================================

void test_persistence_failure_halts() {
  const Articles a = vote_articles();
  auto mp = memory();
  Stash stash(a, mp, quiet_config());
  std::string error;
  expect(stash.open(&error), "open: " + error);

  mp->fail_after(1);  // the ops log write succeeds, the order write fails
  const Operation v = cast_vote(a, 0, kSecret1, "pro");
  SubmitReport s = stash.submit(v);
  expect(s.put == PutStatus::accepted_new, "op durably stored");
  CommitReport c = stash.commit();
  expect(c.error_code == ErrorCode::persistence_failure, "order write failure reported");
  expect(stash.halted(), "stash halted");
  expect(stash.status(v.op_id) != OpStatus::accepted, "op not accepted without its order record");

  SubmitReport after = stash.submit(cast_vote(a, 1, kSecret2, "pro"));
  expect(after.error_code == ErrorCode::contract_halted, "later submits refused");
  expect(stash.commit().error_code == ErrorCode::contract_halted, "later commits refused");

  mp->fail_after(-1);
  Stash reopened(a, mp, quiet_config());
  expect(reopened.open(&error), "reopen after failure: " + error);
  expect(reopened.status(v.op_id) == OpStatus::accepted, "acknowledged op ordered on recovery");
}

void test_pending_ttl_eviction() {
  const Articles a = vote_articles();
  StashConfig cfg = quiet_config();
  cfg.pending_ttl_commits = 2;
  Stash stash(a, memory(), cfg);
  const Operation orphan = relay(a, cast_vote(a, 0, kSecret1, "pro"), kSecret1);

  expect(stash.submit(orphan).status == OpStatus::pending, "orphan pending");
  expect(stash.commit().evicted.empty(), "survives first round");
  CommitReport c = stash.commit();
  expect(c.evicted == std::vector<OpId>({orphan.op_id}), "evicted after ttl");
  expect(stash.status(orphan.op_id) == OpStatus::unknown, "evicted op forgotten");
  expect(stash.reason(orphan.op_id) == ErrorCode::pending_evicted, "eviction reason kept");
  expect(stash.submit(orphan).put == PutStatus::accepted_new, "evicted op may be resubmitted");
}

void test_pending_max_eviction() {
  const Articles a = vote_articles();
  StashConfig cfg = quiet_config();
  cfg.pending_max = 1;
  Stash stash(a, memory(), cfg);
  const Operation first = relay(a, cast_vote(a, 0, kSecret1, "pro"), kSecret1);
  const Operation second = relay(a, cast_vote(a, 1, kSecret2, "pro"), kSecret2);
  stash.submit(first);
  stash.submit(second);
  CommitReport c = stash.commit();
  expect(c.evicted == std::vector<OpId>({first.op_id}), "oldest arrival evicted");
  expect(stash.pending() == std::vector<OpId>({second.op_id}), "newest kept");
}

void test_file_recovery_with_checkpoint() {
  const fs::path dir = fresh_dir("recovery");
  const Articles a = vote_articles();
  StashConfig cfg = quiet_config();
  cfg.checkpoint_interval = 2;

  const Operation v1 = cast_vote(a, 0, kSecret1, "pro");
  const Operation r1 = relay(a, v1, kSecret1);
  const Operation v2 = cast_vote(a, 1, kSecret2, "counter");
  const Operation orphan = relay(a, cast_vote(a, 2, kSecret3, "pro"), kSecret3);

  std::vector<OpId> order;
  std::string digest;
  {
    Stash stash(a, std::make_shared<FilePersistence>(dir.string()), cfg);
    std::string error;
    expect(stash.open(&error), "open: " + error);
    expect(stash.accept(v1).status == OpStatus::accepted, "v1");
    expect(stash.accept(r1).status == OpStatus::accepted, "r1");
    expect(stash.accept(v2).status == OpStatus::accepted, "v2");
    expect(stash.submit(orphan).status == OpStatus::pending, "orphan");
    order = stash.order();
    digest = stash.state_digest();
  }
  expect(fs::exists(dir / "checkpoint.head"), "checkpoint written");

  std::string error;
  auto back = Stash::open_existing(std::make_shared<FilePersistence>(dir.string()), cfg, &error);
  expect(back != nullptr, "reopen: " + error);
  expect(back->order() == order, "order recovered");
  expect(back->state_digest() == digest, "state recovered");
  expect(back->status(orphan.op_id) == OpStatus::pending, "pending op recovered");
  expect(back->query("totalVotes") == std::string("2"), "aggregates recovered");

  // Recovery keeps accepting where it left off.
  expect(back->accept(cast_vote(a, 2, kSecret3, "pro")).status == OpStatus::accepted, "resume");
  fs::remove_all(dir);
}

void test_verdict_survives_restart() {
  const fs::path dir = fresh_dir("verdict");
  const Articles a = vote_articles();
  const Operation forged = cast_vote(a, 0, kSecret2, "pro");  // signer 0 belongs to kSecret1
  const Operation honest = cast_vote(a, 0, kSecret1, "counter");
  const Operation child = relay(a, forged, kSecret2);
  {
    Stash stash(a, std::make_shared<FilePersistence>(dir.string()), quiet_config());
    expect(stash.accept(forged).status == OpStatus::rejected, "forged vote rejected");
    expect(stash.reason(forged.op_id) == ErrorCode::verification_failure, "rejected by verification");
    expect(stash.accept(honest).status == OpStatus::accepted, "honest vote spends the same cell");
    expect(stash.submit(child).status == OpStatus::rejected, "child of forged vote rejected");
  }

  std::string error;
  auto back = Stash::open_existing(std::make_shared<FilePersistence>(dir.string()), quiet_config(), &error);
  expect(back != nullptr, "reopen: " + error);
  expect(back->status(forged.op_id) == OpStatus::rejected, "forged vote still rejected");
  expect(back->reason(forged.op_id) == ErrorCode::verification_failure,
         "verdict not reclassified as a conflict");
  expect(back->status(child.op_id) == OpStatus::rejected, "child still rejected");
  expect(back->reason(child.op_id) == ErrorCode::rejected_ancestor, "child reason kept");
  expect(back->spent_by(owned_addr(a.genesis, 0)) == honest.op_id, "honest vote keeps the cell");

  auto mp = memory();
  {
    Stash stash(a, mp, quiet_config());
    stash.accept(forged);
    stash.accept(honest);
  }
  Stash again(a, mp, quiet_config());
  expect(again.open(&error), "memory reopen: " + error);
  expect(again.reason(forged.op_id) == ErrorCode::verification_failure, "memory backend keeps verdict");
  fs::remove_all(dir);
}

void test_log_tamper_detected() {
  const fs::path dir = fresh_dir("tamper");
  const Articles a = vote_articles();
  {
    Stash stash(a, std::make_shared<FilePersistence>(dir.string()), quiet_config());
    stash.accept(cast_vote(a, 0, kSecret1, "pro"));
    stash.accept(cast_vote(a, 1, kSecret2, "counter"));
    stash.accept(cast_vote(a, 2, kSecret3, "counter"));
  }
  const fs::path log = dir / "operations.ndjson";
  std::string content;
  {
    std::ifstream ifs(log, std::ios::binary);
    content.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
  }
  const size_t at = content.find("\"pro\"");
  expect(at != std::string::npos && at < content.find('\n'), "first record carries the pro vote");
  content[at + 3] = 'x';
  {
    std::ofstream ofs(log, std::ios::binary | std::ios::trunc);
    ofs << content;
  }

  Stash stash(a, std::make_shared<FilePersistence>(dir.string()), quiet_config());
  std::string error;
  expect(!stash.open(&error), "tampered log refused");
  expect(stash.halted() && stash.halt_code() == ErrorCode::integrity_violation, "integrity violation");
  expect(stash.submit(cast_vote(a, 0, kSecret1, "pro")).error_code == ErrorCode::contract_halted,
         "halted stash refuses submits");
  fs::remove_all(dir);
}

void test_torn_tail_dropped() {
  const fs::path dir = fresh_dir("torn");
  const Articles a = vote_articles();
  const Operation v1 = cast_vote(a, 0, kSecret1, "pro");
  {
    Stash stash(a, std::make_shared<FilePersistence>(dir.string()), quiet_config());
    stash.accept(v1);
  }
  {
    std::ofstream ofs(dir / "operations.ndjson", std::ios::binary | std::ios::app);
    ofs << "{\"kind\":\"op\",\"op\":{\"con";
  }
  Stash stash(a, std::make_shared<FilePersistence>(dir.string()), quiet_config());
  std::string error;
  expect(stash.open(&error), "torn tail tolerated: " + error);
  expect(stash.status(v1.op_id) == OpStatus::accepted, "complete records kept");
  expect(stash.accept(cast_vote(a, 1, kSecret2, "pro")).status == OpStatus::accepted,
         "log appendable after truncation");
  fs::remove_all(dir);
}

void test_append_log_chain() {
  const fs::path dir = fresh_dir("append_log");
  const std::string path = (dir / "log.ndjson").string();
  {
    AppendLog log(path);
    std::string error;
    expect(log.open(nullptr, nullptr, &error), "open empty log: " + error);
    jsonlite::Object body;
    body["n"] = jsonlite::Value{static_cast<std::uint64_t>(1)};
    expect(log.append("note", body, &error), "append 1");
    expect(log.append("note", body, &error), "append 2");
    expect(log.last_seq() == 2, "two records");
  }
  AppendLog log(path);
  std::vector<LogRecord> records;
  LogOpenReport report;
  std::string error;
  expect(log.open(&records, &report, &error), "reopen: " + error);
  expect(records.size() == 2 && records[1].prev != kGenesisChainDigest, "records chained");
  expect(records[0].prev == kGenesisChainDigest, "chain starts at genesis digest");
  expect(!report.torn_tail_dropped && !report.chain_broken, "clean log");
  fs::remove_all(dir);
}

void test_blob_store_integrity() {
  const fs::path dir = fresh_dir("blobs");
  BlobStore store(dir.string());
  const std::string digest = store.put("snapshot bytes");
  expect(digest == blake3_hex("snapshot bytes"), "blob keyed by content");
  expect(store.contains(digest), "blob present");
  expect(store.get(digest) == std::string("snapshot bytes"), "blob readable");
  expect(!store.get(std::string(64, '0')).has_value(), "absent blob");
  fs::remove_all(dir);
}

// ============================================================================
// Exchange
// ============================================================================

void test_export_import() {
  const Articles a = vote_articles();
  Stash source(a, memory(), quiet_config());
  const Operation v1 = cast_vote(a, 0, kSecret1, "pro");
  const Operation r1 = relay(a, v1, kSecret1);
  const Operation v2 = cast_vote(a, 1, kSecret2, "counter");
  source.accept(v1);
  source.accept(r1);
  source.accept(v2);

  std::stringstream subset;
  std::string error;
  expect(source.export_subset({r1.op_id}, subset, &error), "export subset: " + error);
  ExchangeBundle bundle;
  std::stringstream subset_copy(subset.str());
  expect(read_exchange_stream(subset_copy, &bundle, &error), "read subset: " + error);
  expect(bundle.operations.size() == 2, "subset carries closure only");
  expect(bundle.operations[0].op_id == v1.op_id, "closure in accepted order");
  expect(!source.export_subset({std::string(64, 'f')}, subset, &error), "unknown terminal refused");

  std::stringstream all;
  expect(source.export_all(all, &error), "export all: " + error);
  Stash sink(a, memory(), quiet_config());
  ImportReport report;
  expect(sink.import_stream(all, &report, &error), "import: " + error);
  expect(report.received == 3 && report.accepted_new == 3, "all ops received");
  expect(sink.aggregates() == source.aggregates(), "same aggregates after import");
  expect(sink.status(r1.op_id) == OpStatus::accepted, "relay accepted after import");

  std::stringstream again;
  source.export_all(again, &error);
  expect(sink.import_stream(again, &report, &error), "reimport: " + error);
  expect(report.already_present == 3, "reimport is idempotent");
}

void test_truncated_stream_refused() {
  const Articles a = vote_articles();
  std::stringstream out;
  std::string error;
  expect(write_exchange_stream(out, a, {cast_vote(a, 0, kSecret1, "pro"), cast_vote(a, 1, kSecret2, "pro")},
                               &error),
         "write stream");
  std::string text = out.str();
  text.erase(text.rfind('\n', text.size() - 2) + 1);
  std::stringstream in(text);
  ExchangeBundle bundle;
  expect(!read_exchange_stream(in, &bundle, &error), "truncated stream refused");
  expect(error.find("truncated") != std::string::npos, "truncation named");
}

void test_foreign_contract_refused() {
  const Articles a = vote_articles();
  const Articles b = vote_articles("other-ballot");
  Stash stash(a, memory(), quiet_config());
  ExchangeBundle bundle;
  bundle.articles = b;
  bundle.operations = {cast_vote(b, 0, kSecret1, "pro")};
  std::string error;
  expect(!stash.import_bundle(bundle, nullptr, &error), "foreign bundle refused");
  expect(error.find("contract_mismatch") != std::string::npos, "mismatch named");
  expect(stash.submit(bundle.operations[0]).error_code == ErrorCode::contract_mismatch,
         "foreign op refused");
}

void test_merge_partial_histories() {
  const Articles a = vote_articles();
  Stash left(a, memory(), quiet_config());
  Stash right(a, memory(), quiet_config());
  const Operation v1 = cast_vote(a, 0, kSecret1, "pro");
  const Operation v2 = cast_vote(a, 1, kSecret2, "counter");
  const Operation r2 = relay(a, v2, kSecret2);
  left.accept(v1);
  right.accept(v2);
  left.submit(r2);  // waits for v2

  CommitReport report;
  std::string error;
  expect(left.merge(right, &report, &error), "merge: " + error);
  expect(left.status(v2.op_id) == OpStatus::accepted, "merged op accepted");
  expect(left.status(r2.op_id) == OpStatus::accepted, "waiting op released by merge");
  expect(left.query("totalVotes") == std::string("2"), "both votes counted");
}

// ============================================================================
// Ambient: config, ingest, events, versions
// ============================================================================

void test_config_validation() {
  StashConfig c;
  expect(validate_config(c).ok, "defaults valid");
  c.compression = "gzip";
  expect(!validate_config(c).ok, "unknown compression refused");
  c.compression = "off";
  c.verify_threads = 4;
  ConfigValidationResult r = validate_config(c);
  expect(r.ok && !r.warnings.empty(), "threads without parallel verify warns");

  StashConfig parsed;
  std::string error;
  expect(parse_config_json("{\"pending_max\":7,\"parallel_verify\":true}", &parsed, &error),
         "parse config: " + error);
  expect(parsed.pending_max == 7 && parsed.parallel_verify, "config fields applied");
  expect(parsed.checkpoint_interval == 64, "absent fields keep defaults");
  expect(!parse_config_json("{\"pendingmax\":7}", &parsed, &error), "unknown key refused");

  setenv("CELLSTASH_PENDING_TTL_COMMITS", "12", 1);
  setenv("CELLSTASH_CHECKPOINT_INTERVAL", "often", 1);
  error.clear();
  StashConfig env = config_from_env({}, &error);
  expect(env.pending_ttl_commits == 12, "env overrides ttl");
  expect(env.checkpoint_interval == 64 && !error.empty(), "bad env value reported");
  unsetenv("CELLSTASH_PENDING_TTL_COMMITS");
  unsetenv("CELLSTASH_CHECKPOINT_INTERVAL");
}

void test_ingest_queue() {
  const Articles a = vote_articles();
  Stash stash(a, memory(), quiet_config());
  const Operation v1 = cast_vote(a, 0, kSecret1, "pro");
  const Operation r1 = relay(a, v1, kSecret1);
  const Operation v2 = cast_vote(a, 1, kSecret2, "counter");
  {
    IngestQueue queue(stash, 8);
    auto f_v1 = queue.enqueue(v1);
    auto f_r1 = queue.enqueue(r1);
    auto f_v2 = queue.enqueue(v2);
    queue.flush();
    expect(f_v1.get().status == OpStatus::accepted, "v1 accepted via queue");
    expect(f_r1.get().status == OpStatus::accepted, "r1 accepted once its producer arrived");
    expect(f_v2.get().status == OpStatus::accepted, "v2 accepted via queue");
    expect(queue.depth() == 0, "queue drained");
    expect(queue.batches() >= 1, "batched");
    queue.stop();
  }
  expect(stash.order().size() == 4, "all ops ordered");
}

void test_ingest_concurrent_producers() {
  const Articles a = vote_articles();
  Stash stash(a, memory(), quiet_config());
  const Operation first = cast_vote(a, 0, kSecret1, "pro");
  const Operation second = cast_vote(a, 0, kSecret1, "counter", 5);  // same signer cell
  const std::vector<Operation> ops = {first, second, cast_vote(a, 1, kSecret2, "pro"),
                                      cast_vote(a, 2, kSecret3, "counter")};

  std::vector<std::future<SubmitReport>> futures(ops.size());
  {
    IngestQueue queue(stash, 2);
    std::vector<std::thread> producers;
    for (size_t i = 0; i < ops.size(); ++i) {
      producers.emplace_back([&queue, &ops, &futures, i] { futures[i] = queue.enqueue(ops[i]); });
    }
    for (auto& t : producers) t.join();
    queue.flush();

    std::vector<SubmitReport> reports;
    for (auto& f : futures) {
      expect(f.valid(), "every producer got a future");
      reports.push_back(f.get());
    }
    expect(reports[2].status == OpStatus::accepted && reports[3].status == OpStatus::accepted,
           "independent votes accepted");
    const bool first_won = reports[0].status == OpStatus::accepted;
    const SubmitReport& winner = first_won ? reports[0] : reports[1];
    const SubmitReport& loser = first_won ? reports[1] : reports[0];
    expect(winner.status == OpStatus::accepted, "one double spend accepted");
    expect(loser.status == OpStatus::conflicted, "the other double spend conflicted");
    expect(loser.error_code == ErrorCode::conflicting_consumption, "loser reports the conflict");
    expect(stash.spent_by(owned_addr(a.genesis, 0)) == winner.op_id, "cell spent by the winner");
    queue.stop();
  }

  const std::vector<OpId>& order = stash.order();
  expect(order.size() == 4, "genesis plus three accepted ops");
  std::vector<OpId> sorted = order;
  std::sort(sorted.begin(), sorted.end());
  expect(std::adjacent_find(sorted.begin(), sorted.end()) == sorted.end(), "each op ordered once");
}

std::atomic<int> g_events{0};
std::atomic<int> g_accept_events{0};

void count_event(const StashEvent& ev) {
  g_events++;
  if (ev.kind == "accept") g_accept_events++;
}

void test_event_hook() {
  g_events = 0;
  g_accept_events = 0;
  set_stash_event_hook(&count_event);
  const Articles a = vote_articles();
  Stash stash(a, memory(), quiet_config());
  stash.accept(cast_vote(a, 0, kSecret1, "pro"));
  set_stash_event_hook(nullptr);
  expect(g_accept_events == 1, "one accept event");
  expect(g_events >= 2, "submit and accept events");

  StashEvent ev;
  ev.kind = "accept";
  ev.op_id = "abc";
  const std::string json = event_to_json(ev);
  expect(json.find("\"kind\":\"accept\"") != std::string::npos, "event serialized");
  expect(global_stash_stats().accepted.load() >= 1, "stats counted");
}

void test_version_compatibility() {
  const auto manifest = version::current_manifest();
  expect(manifest.hash_algorithm == version::HASH_ALGORITHM_VERSION, "manifest hash version");
  expect(version::check_compatibility("log", version::LOG_FORMAT_VERSION, version::LOG_FORMAT_VERSION).ok,
         "same version compatible");
  auto r = version::check_compatibility("log", version::LOG_FORMAT_VERSION + 1, version::LOG_FORMAT_VERSION);
  expect(!r.ok && r.error_code == "format_version_mismatch", "future version refused");
}

}  // namespace

int main() {
  std::cout << "=== Cellstash Test Suite ===\n";

  std::cout << "\n[Commitments]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("op_id commits to content", test_op_id_commits_to_content);
  run_test("articles JSON roundtrip", test_articles_json_roundtrip);
  run_test("JSON surrogate pairs", test_json_surrogate_pairs);

  std::cout << "\n[Capabilities and State]\n";
  run_test("capability check", test_capability_check);
  run_test("genesis snapshot", test_genesis_snapshot);
  run_test("snapshot JSON roundtrip", test_snapshot_json_roundtrip);
  run_test("sum aggregator saturates", test_sum_aggregator_saturates);

  std::cout << "\n[Ordering]\n";
  run_test("vote scenario", test_vote_scenario);
  run_test("genesis submission", test_genesis_submission);
  run_test("unresolved dependency", test_unresolved_dependency);
  run_test("smallest op_id first", test_smallest_op_id_first);
  run_test("order independent of arrival", test_order_independent_of_arrival);
  run_test("conflict cascade", test_conflict_cascade);
  run_test("verification failure", test_verification_failure);
  run_test("malformed input", test_malformed_input);
  run_test("append-only stability", test_append_only_stability);
  run_test("parallel verify same order", test_parallel_verify_same_order);

  std::cout << "\n[Dependency Graph]\n";
  run_test("cycle detection", test_graph_cycle_detection);
  run_test("conflict on accept", test_graph_conflict_on_accept);

  std::cout << "\n[Persistence and Recovery]\n";
  run_test("persistence failure halts", test_persistence_failure_halts);
  run_test("pending ttl eviction", test_pending_ttl_eviction);
  run_test("pending max eviction", test_pending_max_eviction);
  run_test("file recovery with checkpoint", test_file_recovery_with_checkpoint);
  run_test("verdict survives restart", test_verdict_survives_restart);
  run_test("log tamper detected", test_log_tamper_detected);
  run_test("torn tail dropped", test_torn_tail_dropped);
  run_test("append log chain", test_append_log_chain);
  run_test("blob store integrity", test_blob_store_integrity);

  std::cout << "\n[Exchange]\n";
  run_test("export/import", test_export_import);
  run_test("truncated stream refused", test_truncated_stream_refused);
  run_test("foreign contract refused", test_foreign_contract_refused);
  run_test("merge partial histories", test_merge_partial_histories);

  std::cout << "\n[Ambient]\n";
  run_test("config validation", test_config_validation);
  run_test("ingest queue", test_ingest_queue);
  run_test("ingest concurrent producers", test_ingest_concurrent_producers);
  run_test("event hook", test_event_hook);
  run_test("version compatibility", test_version_compatibility);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
