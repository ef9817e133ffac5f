#include "cellstash/verifier.hpp"

#include <algorithm>

#include "cellstash/capability.hpp"
#include "cellstash/hash.hpp"
#include "cellstash/operation.hpp"

namespace cellstash {

namespace {

bool allowed(const std::vector<std::string>& names, const std::string& name) {
  return std::find(names.begin(), names.end(), name) != names.end();
}

VerifyResult reject(std::string detail) {
  VerifyResult r;
  r.ok = false;
  r.error_code = ErrorCode::verification_failure;
  r.detail = std::move(detail);
  return r;
}

}  // namespace

std::vector<Cell> produced_owned_cells(const Operation& op) {
  std::vector<Cell> out;
  out.reserve(op.owned_out.size());
  for (uint32_t i = 0; i < op.owned_out.size(); ++i) {
    const auto& o = op.owned_out[i];
    out.push_back(Cell{owned_addr(op, i), o.name, o.owner, o.value});
  }
  return out;
}

std::vector<GlobalCell> produced_global_cells(const Operation& op) {
  std::vector<GlobalCell> out;
  out.reserve(op.global_out.size());
  for (uint32_t i = 0; i < op.global_out.size(); ++i) {
    const auto& g = op.global_out[i];
    out.push_back(GlobalCell{global_addr(op, i), g.name, g.value});
  }
  return out;
}

VerifyResult CapabilityVerifier::verify(const Operation& op, const std::vector<Cell>& consumed,
                                        const std::vector<GlobalCell>& read,
                                        const Articles& articles) const {
  const MethodRule* rule = articles.find_method(op.method);
  if (!rule) return reject("method not declared in articles: " + op.method);
  if (consumed.size() != op.consumed.size() || read.size() != op.reading.size()) {
    return reject("input cells do not match operation inputs");
  }

  for (size_t i = 0; i < consumed.size(); ++i) {
    const Cell& cell = consumed[i];
    if (!allowed(rule->consumes, cell.name)) {
      return reject(op.method + " may not consume state '" + cell.name + "'");
    }
    if (check_capability(cell, op.consumed[i].witness, articles) != CapabilityDecision::admit) {
      return reject("capability check failed for " + cell.addr.to_string());
    }
  }
  for (const auto& cell : read) {
    if (!allowed(rule->reads, cell.name)) {
      return reject(op.method + " may not read state '" + cell.name + "'");
    }
  }
  for (const auto& o : op.owned_out) {
    if (!allowed(rule->produces_owned, o.name)) {
      return reject(op.method + " may not produce owned state '" + o.name + "'");
    }
    if (!is_hex_digest(o.owner)) return reject("owned output '" + o.name + "' has no capability token");
  }
  for (const auto& g : op.global_out) {
    if (!allowed(rule->produces_global, g.name)) {
      return reject(op.method + " may not produce global state '" + g.name + "'");
    }
  }

  VerifyResult r;
  r.ok = true;
  r.owned = produced_owned_cells(op);
  r.global = produced_global_cells(op);
  return r;
}

}  // namespace cellstash
