#pragma once

// cellstash/version.hpp — Version manifest for every persisted and exchanged format.
//
// PURPOSE:
//   Prevent silent format drift between parties. Two stashes that disagree
//   on any of the constants below cannot be assumed to derive the same
//   op_ids or the same evaluation order.
//
// INVARIANT:
//   All version constants are compile-time. Readers of persisted data call
//   check_compatibility() before trusting anything they load.
//
// EXTENSION_POINT: format_migration
//   Current: hard-fail on mismatch.
//   Upgrade path: a migration step that rewrites an older operations log
//   into the current record schema. Never accept a newer format silently.

#include <cstdint>
#include <string>

namespace cellstash {
namespace version {

// Version 1 = BLAKE3, 32-byte output, 64-char lowercase hex.
// Bumping this changes every commitment in every stash.
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// Canonical operation body: sorted-key JSON over
// {consumed, contract_id, global_out, method, nonce, owned_out, reading}.
constexpr uint32_t OPERATION_FORMAT_VERSION = 1;

// NDJSON records with {seq, prev, kind, ...} and a BLAKE3 "log:" chain.
constexpr uint32_t LOG_FORMAT_VERSION = 1;

// Snapshot blob schema plus checkpoint.head pointer.
constexpr uint32_t CHECKPOINT_FORMAT_VERSION = 1;

// Export/import stream schema (articles header followed by operations).
constexpr uint32_t EXCHANGE_FORMAT_VERSION = 1;

struct VersionManifest {
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t operation_format{OPERATION_FORMAT_VERSION};
  uint32_t log_format{LOG_FORMAT_VERSION};
  uint32_t checkpoint_format{CHECKPOINT_FORMAT_VERSION};
  uint32_t exchange_format{EXCHANGE_FORMAT_VERSION};
  std::string semver;
  std::string hash_primitive;
  bool zstd_enabled{false};
};

VersionManifest current_manifest();

std::string manifest_to_json(const VersionManifest& m);

struct CompatibilityResult {
  bool ok{true};
  std::string error_code;
  std::string description;
};

// Checks a format version found in persisted or imported data against the
// one this build writes. `surface` names the format in the error text.
CompatibilityResult check_compatibility(const std::string& surface, uint32_t found,
                                        uint32_t expected);

}  // namespace version
}  // namespace cellstash
