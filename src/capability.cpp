#include "cellstash/capability.hpp"

#include "cellstash/hash.hpp"

namespace cellstash {

std::string auth_token(const std::string& secret) {
  return hash_domain(kDomainAuth, secret);
}

CapabilityDecision check_capability(const Cell& cell, const std::string& witness,
                                    const Articles& articles) {
  // Contract binding happens upstream: ops naming another contract_id are
  // malformed. Here an unaddressed cell or unfinalized articles are refused.
  if (cell.addr.op_id.empty() || articles.contract_id.empty()) return CapabilityDecision::reject;
  if (!is_hex_digest(cell.owner)) return CapabilityDecision::reject;
  return auth_token(witness) == cell.owner ? CapabilityDecision::admit
                                           : CapabilityDecision::reject;
}

}  // namespace cellstash
