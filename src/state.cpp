#include "cellstash/state.hpp"

#include <charconv>
#include <limits>

#include "cellstash/hash.hpp"
#include "cellstash/version.hpp"

namespace cellstash {

const Cell* StateSnapshot::find_owned(const CellAddr& addr) const {
  auto it = owned.find(addr);
  return it == owned.end() ? nullptr : &it->second;
}

const GlobalCell* StateSnapshot::find_global(const CellAddr& addr) const {
  auto it = global.find(addr);
  return it == global.end() ? nullptr : &it->second;
}

std::vector<Cell> StateSnapshot::cells_owned_by(const std::string& owner_token) const {
  std::vector<Cell> out;
  auto it = by_owner.find(owner_token);
  if (it == by_owner.end()) return out;
  for (const auto& addr : it->second) {
    if (const Cell* c = find_owned(addr)) out.push_back(*c);
  }
  return out;
}

namespace {

void insert_owned(StateSnapshot& s, const Cell& cell) {
  s.owned[cell.addr] = cell;
  s.by_owner[cell.owner].insert(cell.addr);
}

void erase_owned(StateSnapshot& s, const CellAddr& addr, Transition& t) {
  auto it = s.owned.find(addr);
  if (it == s.owned.end()) return;
  auto owner_it = s.by_owner.find(it->second.owner);
  if (owner_it != s.by_owner.end()) {
    owner_it->second.erase(addr);
    if (owner_it->second.empty()) s.by_owner.erase(owner_it);
  }
  t.destroyed.emplace(addr, it->second);
  s.owned.erase(it);
}

}  // namespace

StateSnapshot genesis_snapshot(const Articles& articles) {
  StateSnapshot s;
  VerifyResult v;
  v.ok = true;
  v.owned = produced_owned_cells(articles.genesis);
  v.global = produced_global_cells(articles.genesis);
  apply(s, articles.genesis, v);
  return s;
}

Transition apply(StateSnapshot& snapshot, const Operation& op, const VerifyResult& verified) {
  Transition t;
  t.op_id = op.op_id;
  for (const auto& in : op.consumed) erase_owned(snapshot, in.addr, t);
  for (const auto& c : verified.owned) insert_owned(snapshot, c);
  for (const auto& g : verified.global) snapshot.global[g.addr] = g;
  snapshot.position += 1;
  snapshot.last_op = op.op_id;
  return t;
}

bool collect_inputs(const StateSnapshot& snapshot, const Operation& op, std::vector<Cell>* consumed,
                    std::vector<GlobalCell>* read, std::string* error) {
  consumed->clear();
  read->clear();
  for (const auto& in : op.consumed) {
    const Cell* c = snapshot.find_owned(in.addr);
    if (!c) {
      if (error) *error = "consumed cell not live: " + in.addr.to_string();
      return false;
    }
    consumed->push_back(*c);
  }
  for (const auto& addr : op.reading) {
    const GlobalCell* g = snapshot.find_global(addr);
    if (!g) {
      if (error) *error = "read cell not live: " + addr.to_string();
      return false;
    }
    read->push_back(*g);
  }
  return true;
}

VerifyResult StateEvaluator::verify(const StateSnapshot& snapshot, const Operation& op) const {
  std::vector<Cell> consumed;
  std::vector<GlobalCell> read;
  std::string error;
  if (!collect_inputs(snapshot, op, &consumed, &read, &error)) {
    VerifyResult r;
    r.error_code = ErrorCode::unresolved_dependency;
    r.detail = error;
    return r;
  }
  return verifier_.verify(op, consumed, read, articles_);
}

EvalOutcome StateEvaluator::evaluate(StateSnapshot& snapshot, const Operation& op) const {
  EvalOutcome out;
  VerifyResult v = verify(snapshot, op);
  if (!v.ok) {
    out.error_code = v.error_code == ErrorCode::none ? ErrorCode::verification_failure : v.error_code;
    out.detail = v.detail;
    return out;
  }
  out.ok = true;
  out.transition = apply(snapshot, op, v);
  return out;
}

bool StateEvaluator::replay(StateSnapshot& from, const std::vector<Operation>& ops,
                            std::string* error) const {
  for (const auto& op : ops) {
    EvalOutcome r = evaluate(from, op);
    if (!r.ok) {
      if (error) *error = op.op_id + ": " + to_string(r.error_code) + ": " + r.detail;
      return false;
    }
  }
  return true;
}

// ---------------------------------------------------------------------------
// Aggregators
// ---------------------------------------------------------------------------

std::string evaluate_aggregator(const Aggregator& ag, const StateSnapshot& snapshot) {
  uint64_t count = 0;
  uint64_t sum = 0;
  std::set<std::string> values;
  for (const auto& [addr, cell] : snapshot.global) {
    if (cell.name != ag.state) continue;
    switch (ag.kind) {
      case AggregatorKind::count:
        ++count;
        break;
      case AggregatorKind::count_eq:
        if (cell.value == ag.match) ++count;
        break;
      case AggregatorKind::sum: {
        uint64_t v = 0;
        const char* first = cell.value.data();
        const char* last = first + cell.value.size();
        auto [ptr, ec] = std::from_chars(first, last, v);
        // Non-numeric values do not contribute. The total saturates at the
        // uint64 maximum instead of wrapping.
        if (ec == std::errc() && ptr == last) {
          sum = v > std::numeric_limits<uint64_t>::max() - sum ? std::numeric_limits<uint64_t>::max()
                                                               : sum + v;
        }
        break;
      }
      case AggregatorKind::set:
        values.insert(cell.value);
        break;
    }
  }
  switch (ag.kind) {
    case AggregatorKind::count:
    case AggregatorKind::count_eq:
      return std::to_string(count);
    case AggregatorKind::sum:
      return std::to_string(sum);
    case AggregatorKind::set: {
      std::string out;
      for (const auto& v : values) {
        if (!out.empty()) out += ',';
        out += v;
      }
      return out;
    }
  }
  return "";
}

std::map<std::string, std::string> aggregate(const Articles& articles, const StateSnapshot& snapshot) {
  std::map<std::string, std::string> out;
  for (const auto& ag : articles.aggregators) out[ag.name] = evaluate_aggregator(ag, snapshot);
  return out;
}

std::optional<std::string> query_aggregator(const Articles& articles, const StateSnapshot& snapshot,
                                            const std::string& name) {
  for (const auto& ag : articles.aggregators) {
    if (ag.name == name) return evaluate_aggregator(ag, snapshot);
  }
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

jsonlite::Object snapshot_to_object(const StateSnapshot& s) {
  using jsonlite::Array;
  using jsonlite::Object;
  using jsonlite::Value;

  Array owned;
  for (const auto& [addr, c] : s.owned) {
    Object o;
    o["addr"] = Value{addr.to_string()};
    o["name"] = Value{c.name};
    o["owner"] = Value{c.owner};
    o["value"] = Value{c.value};
    owned.push_back(Value{std::move(o)});
  }
  Array global;
  for (const auto& [addr, g] : s.global) {
    Object o;
    o["addr"] = Value{addr.to_string()};
    o["name"] = Value{g.name};
    o["value"] = Value{g.value};
    global.push_back(Value{std::move(o)});
  }
  Object out;
  out["format"] = Value{static_cast<std::uint64_t>(version::CHECKPOINT_FORMAT_VERSION)};
  out["position"] = Value{s.position};
  out["last_op"] = Value{s.last_op};
  out["owned"] = Value{std::move(owned)};
  out["global"] = Value{std::move(global)};
  return out;
}

std::string snapshot_to_json(const StateSnapshot& snapshot) {
  return jsonlite::serialize(snapshot_to_object(snapshot));
}

std::optional<StateSnapshot> snapshot_from_json(const std::string& json, std::string* error) {
  auto fail = [&](const std::string& why) -> std::optional<StateSnapshot> {
    if (error) *error = why;
    return std::nullopt;
  };
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(json, &err);
  if (err) return fail(err->code + ": " + err->message);

  auto compat = version::check_compatibility(
      "checkpoint", static_cast<uint32_t>(jsonlite::get_u64(obj, "format", 0)),
      version::CHECKPOINT_FORMAT_VERSION);
  if (!compat.ok) return fail(compat.description);

  StateSnapshot s;
  s.position = jsonlite::get_u64(obj, "position", 0);
  s.last_op = jsonlite::get_string(obj, "last_op");
  if (const auto* owned = jsonlite::get_array(obj, "owned")) {
    for (const auto& item : *owned) {
      const auto* o = jsonlite::as_object(item);
      if (!o) return fail("snapshot owned entry is not an object");
      auto addr = parse_cell_addr(jsonlite::get_string(*o, "addr"));
      if (!addr) return fail("snapshot owned entry has a bad addr");
      insert_owned(s, Cell{*addr, jsonlite::get_string(*o, "name"), jsonlite::get_string(*o, "owner"),
                           jsonlite::get_string(*o, "value")});
    }
  }
  if (const auto* global = jsonlite::get_array(obj, "global")) {
    for (const auto& item : *global) {
      const auto* o = jsonlite::as_object(item);
      if (!o) return fail("snapshot global entry is not an object");
      auto addr = parse_cell_addr(jsonlite::get_string(*o, "addr"));
      if (!addr) return fail("snapshot global entry has a bad addr");
      s.global[*addr] =
          GlobalCell{*addr, jsonlite::get_string(*o, "name"), jsonlite::get_string(*o, "value")};
    }
  }
  return s;
}

std::string snapshot_digest(const StateSnapshot& snapshot) {
  return snapshot_commitment(snapshot_to_json(snapshot));
}

}  // namespace cellstash
