#pragma once

// cellstash/capability.hpp — Ownership tokens for destructible cells.
//
// A cell's owner field holds auth_token(secret) = BLAKE3("auth:" || secret).
// Presenting `secret` as the witness for a consumed input proves the right
// to destroy that cell. The check is a pure function of its arguments; it
// never consults time, randomness, or the stash.
//
// EXTENSION_POINT: signature_capabilities
//   Current: hash-preimage capabilities.
//   Upgrade path: owner = public key, witness = signature over the op body
//   without witnesses. The check signature stays (cell, witness, articles).

#include <string>

#include "cellstash/articles.hpp"
#include "cellstash/types.hpp"

namespace cellstash {

enum class CapabilityDecision { admit, reject };

std::string auth_token(const std::string& secret);

CapabilityDecision check_capability(const Cell& cell, const std::string& witness,
                                    const Articles& articles);

}  // namespace cellstash
