#include "cellstash/graph.hpp"

#include <algorithm>
#include <deque>

namespace cellstash {

namespace {

bool terminal(OpStatus s) { return s == OpStatus::conflicted || s == OpStatus::rejected; }
bool unresolved_status(OpStatus s) { return s == OpStatus::pending || s == OpStatus::ready; }

}  // namespace

DependencyGraph::Node DependencyGraph::make_node(const Operation& op) const {
  Node n;
  n.op_id = op.op_id;
  for (const auto& in : op.consumed) {
    n.consumed.push_back(in.addr);
    n.parents.insert(in.addr.op_id);
  }
  for (const auto& addr : op.reading) {
    n.reading.push_back(addr);
    n.parents.insert(addr.op_id);
  }
  return n;
}

void DependencyGraph::index_node(const Node& node) {
  for (const auto& addr : node.consumed) consumers_[addr].insert(node.op_id);
  for (const auto& addr : node.reading) readers_[addr].insert(node.op_id);
  for (const auto& parent : node.parents) children_[parent].insert(node.op_id);
}

void DependencyGraph::insert_accepted(const Operation& op) {
  if (contains(op.op_id)) return;
  Node n = make_node(op);
  n.status = OpStatus::accepted;
  n.arrival_seq = next_arrival_++;
  index_node(n);
  for (const auto& addr : n.consumed) spent_[addr] = n.op_id;
  nodes_.emplace(n.op_id, std::move(n));
}

InsertReport DependencyGraph::classify(const Node& node) const {
  InsertReport r;
  for (const auto& addr : node.consumed) {
    auto it = spent_.find(addr);
    if (it != spent_.end() && it->second != node.op_id) {
      r.status = OpStatus::conflicted;
      r.error_code = ErrorCode::conflicting_consumption;
      r.detail = addr.to_string() + " already consumed by " + it->second;
      return r;
    }
  }
  bool waiting = false;
  for (const auto& parent : node.parents) {
    auto it = nodes_.find(parent);
    if (it == nodes_.end()) {
      waiting = true;
      continue;
    }
    if (terminal(it->second.status)) {
      r.status = OpStatus::rejected;
      r.error_code = ErrorCode::rejected_ancestor;
      r.detail = "producer " + parent + " is " + to_string(it->second.status);
      return r;
    }
    if (it->second.status != OpStatus::accepted) waiting = true;
  }
  if (waiting) {
    r.status = OpStatus::pending;
    r.error_code = ErrorCode::unresolved_dependency;
    return r;
  }
  r.status = OpStatus::ready;
  return r;
}

InsertReport DependencyGraph::insert(const Operation& op, uint64_t arrival_round) {
  auto existing = nodes_.find(op.op_id);
  if (existing != nodes_.end()) {
    InsertReport r;
    r.status = existing->second.status;
    return r;
  }
  Node n = make_node(op);
  n.arrival_seq = next_arrival_++;
  n.arrival_round = arrival_round;
  InsertReport r = classify(n);
  // Terminal statuses are applied by mark_terminal() so the cascade runs.
  n.status = terminal(r.status) ? OpStatus::pending : r.status;
  index_node(n);
  if (n.status == OpStatus::ready) ready_.insert(n.op_id);
  nodes_.emplace(n.op_id, std::move(n));
  return r;
}

AcceptEffects DependencyGraph::mark_accepted(const OpId& op_id) {
  AcceptEffects fx;
  auto it = nodes_.find(op_id);
  if (it == nodes_.end()) return fx;
  Node& node = it->second;
  node.status = OpStatus::accepted;
  ready_.erase(op_id);

  std::set<OpId> conflicted;
  for (const auto& addr : node.consumed) {
    spent_[addr] = op_id;
    for (const auto& other : consumers_[addr]) {
      if (other == op_id) continue;
      auto o = nodes_.find(other);
      if (o != nodes_.end() && unresolved_status(o->second.status)) conflicted.insert(other);
    }
  }

  auto ch = children_.find(op_id);
  if (ch != children_.end()) {
    for (const auto& child : ch->second) {
      if (conflicted.count(child)) continue;
      auto c = nodes_.find(child);
      if (c == nodes_.end() || c->second.status != OpStatus::pending) continue;
      InsertReport r = classify(c->second);
      if (r.status == OpStatus::ready) {
        c->second.status = OpStatus::ready;
        ready_.insert(child);
        fx.ready.push_back(child);
      } else if (r.status == OpStatus::conflicted) {
        conflicted.insert(child);
      }
    }
  }
  fx.conflicted.assign(conflicted.begin(), conflicted.end());
  return fx;
}

std::vector<OpId> DependencyGraph::mark_terminal(const OpId& op_id, OpStatus status) {
  std::set<OpId> cascaded;
  auto it = nodes_.find(op_id);
  if (it == nodes_.end() || it->second.status == OpStatus::accepted) return {};
  it->second.status = status;
  ready_.erase(op_id);

  std::deque<OpId> work{op_id};
  while (!work.empty()) {
    OpId cur = work.front();
    work.pop_front();
    auto ch = children_.find(cur);
    if (ch == children_.end()) continue;
    for (const auto& child : ch->second) {
      auto c = nodes_.find(child);
      if (c == nodes_.end() || !unresolved_status(c->second.status)) continue;
      c->second.status = OpStatus::rejected;
      ready_.erase(child);
      cascaded.insert(child);
      work.push_back(child);
    }
  }
  return {cascaded.begin(), cascaded.end()};
}

bool DependencyGraph::remove(const OpId& op_id) {
  auto it = nodes_.find(op_id);
  if (it == nodes_.end() || it->second.status == OpStatus::accepted) return false;
  const Node& n = it->second;
  for (const auto& addr : n.consumed) {
    auto c = consumers_.find(addr);
    if (c != consumers_.end()) {
      c->second.erase(op_id);
      if (c->second.empty()) consumers_.erase(c);
    }
  }
  for (const auto& addr : n.reading) {
    auto r = readers_.find(addr);
    if (r != readers_.end()) {
      r->second.erase(op_id);
      if (r->second.empty()) readers_.erase(r);
    }
  }
  for (const auto& parent : n.parents) {
    auto p = children_.find(parent);
    if (p != children_.end()) {
      p->second.erase(op_id);
      if (p->second.empty()) children_.erase(p);
    }
  }
  // children_[op_id] stays: those ops still name this producer.
  ready_.erase(op_id);
  nodes_.erase(it);
  return true;
}

OpStatus DependencyGraph::status(const OpId& op_id) const {
  auto it = nodes_.find(op_id);
  return it == nodes_.end() ? OpStatus::unknown : it->second.status;
}

std::vector<OpId> DependencyGraph::unresolved() const {
  std::vector<OpId> out;
  for (const auto& [id, n] : nodes_) {
    if (unresolved_status(n.status)) out.push_back(id);
  }
  return out;
}

std::vector<OpId> DependencyGraph::pending_by_arrival() const {
  std::vector<const Node*> pending;
  for (const auto& [id, n] : nodes_) {
    if (n.status == OpStatus::pending) pending.push_back(&n);
  }
  std::sort(pending.begin(), pending.end(),
            [](const Node* a, const Node* b) { return a->arrival_seq < b->arrival_seq; });
  std::vector<OpId> out;
  out.reserve(pending.size());
  for (const Node* n : pending) out.push_back(n->op_id);
  return out;
}

uint64_t DependencyGraph::arrival_round(const OpId& op_id) const {
  auto it = nodes_.find(op_id);
  return it == nodes_.end() ? 0 : it->second.arrival_round;
}

std::optional<OpId> DependencyGraph::spent_by(const CellAddr& addr) const {
  auto it = spent_.find(addr);
  if (it == spent_.end()) return std::nullopt;
  return it->second;
}

std::vector<OpId> DependencyGraph::consumers(const CellAddr& addr) const {
  auto it = consumers_.find(addr);
  if (it == consumers_.end()) return {};
  return {it->second.begin(), it->second.end()};
}

std::vector<OpId> DependencyGraph::read_by(const CellAddr& addr) const {
  auto it = readers_.find(addr);
  if (it == readers_.end()) return {};
  return {it->second.begin(), it->second.end()};
}

std::vector<OpId> DependencyGraph::dependents(const OpId& op_id) const {
  std::vector<OpId> out;
  auto it = children_.find(op_id);
  if (it == children_.end()) return out;
  for (const auto& child : it->second) {
    if (contains(child)) out.push_back(child);
  }
  return out;
}

std::vector<OpId> DependencyGraph::producers(const OpId& op_id) const {
  auto it = nodes_.find(op_id);
  if (it == nodes_.end()) return {};
  return {it->second.parents.begin(), it->second.parents.end()};
}

std::vector<OpId> DependencyGraph::missing_producers(const OpId& op_id) const {
  std::vector<OpId> out;
  for (const auto& parent : producers(op_id)) {
    if (!contains(parent)) out.push_back(parent);
  }
  return out;
}

std::optional<std::vector<OpId>> DependencyGraph::find_cycle() const {
  // Iterative three-colour DFS over parent edges between unresolved ops.
  enum class Mark { white, grey, black };
  std::map<OpId, Mark> mark;
  for (const auto& [id, n] : nodes_) {
    if (unresolved_status(n.status)) mark[id] = Mark::white;
  }

  for (const auto& [root, root_mark] : mark) {
    if (root_mark != Mark::white) continue;
    std::vector<std::pair<OpId, std::vector<OpId>>> stack;
    auto push = [&](const OpId& id) {
      mark[id] = Mark::grey;
      const Node& n = nodes_.at(id);
      std::vector<OpId> next;
      for (const auto& p : n.parents) {
        if (mark.count(p)) next.push_back(p);
      }
      stack.emplace_back(id, std::move(next));
    };
    push(root);
    while (!stack.empty()) {
      auto& [id, next] = stack.back();
      if (next.empty()) {
        mark[id] = Mark::black;
        stack.pop_back();
        continue;
      }
      OpId p = next.back();
      next.pop_back();
      if (mark[p] == Mark::grey) {
        std::vector<OpId> cycle;
        bool in_cycle = false;
        for (const auto& frame : stack) {
          if (frame.first == p) in_cycle = true;
          if (in_cycle) cycle.push_back(frame.first);
        }
        cycle.push_back(p);
        return cycle;
      }
      if (mark[p] == Mark::white) push(p);
    }
  }
  return std::nullopt;
}

}  // namespace cellstash
