#pragma once

// cellstash/hash.hpp — BLAKE3 hash authority.
//
// DESIGN INVARIANTS:
//   1. BLAKE3 is the sole hash primitive for every commitment in the stash.
//   2. Every commitment is domain separated. The prefixes below are part of
//      the on-disk and on-wire contract; changing one changes every op_id.
//   3. Digests travel as 64-char lowercase hex strings.

#include <string>
#include <string_view>

namespace cellstash {

// Domain prefixes.
inline constexpr std::string_view kDomainOperation = "op:";
inline constexpr std::string_view kDomainArticles  = "art:";
inline constexpr std::string_view kDomainAuth      = "auth:";
inline constexpr std::string_view kDomainSnapshot  = "snap:";
inline constexpr std::string_view kDomainLog       = "log:";

std::string blake3_hex(std::string_view payload);

std::string hash_domain(std::string_view domain, std::string_view payload);

// Commitments used across the stash.
std::string operation_commitment(std::string_view canonical_operation);
std::string articles_commitment(std::string_view canonical_articles);
std::string snapshot_commitment(std::string_view canonical_snapshot);
std::string log_record_digest(std::string_view record_line);

// 64 lowercase hex chars.
bool is_hex_digest(std::string_view d);

std::string hash_library_version();

}  // namespace cellstash
