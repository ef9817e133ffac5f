#include "cellstash/hash.hpp"

// Hash authority for the stash.
//
// EXTENSION_POINT: hash_algorithm_upgrade
//   Current: BLAKE3-256 with prefix domain separation.
//   Upgrade path: bump version::HASH_ALGORITHM_VERSION, keep verifying old
//   op ids for a migration window, then cut over. An op_id produced under one
//   version must never be compared with one produced under another.

#include <array>

extern "C" {
#include <blake3.h>
}

namespace cellstash {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

std::array<unsigned char, BLAKE3_OUT_LEN> digest_parts(std::string_view a,
                                                      std::string_view b) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, a.data(), a.size());
  blake3_hasher_update(&hasher, b.data(), b.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return out;
}

}  // namespace

std::string blake3_hex(std::string_view payload) {
  const auto out = digest_parts({}, payload);
  return to_hex(out.data(), out.size());
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  // Domain prefixes are fixed strings ending in ':' so a prefix can never be
  // confused with the start of another domain's payload.
  const auto out = digest_parts(domain, payload);
  return to_hex(out.data(), out.size());
}

std::string operation_commitment(std::string_view canonical_operation) {
  return hash_domain(kDomainOperation, canonical_operation);
}

std::string articles_commitment(std::string_view canonical_articles) {
  return hash_domain(kDomainArticles, canonical_articles);
}

std::string snapshot_commitment(std::string_view canonical_snapshot) {
  return hash_domain(kDomainSnapshot, canonical_snapshot);
}

std::string log_record_digest(std::string_view record_line) {
  return hash_domain(kDomainLog, record_line);
}

bool is_hex_digest(std::string_view d) {
  if (d.size() != 64) return false;
  for (char c : d) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
  }
  return true;
}

std::string hash_library_version() {
  const char* v = blake3_version();
  return v ? v : "unknown";
}

}  // namespace cellstash
