#include "cellstash/version.hpp"

#include <sstream>

#include "cellstash/hash.hpp"

#ifndef CELLSTASH_VERSION_STRING
#define CELLSTASH_VERSION_STRING "0.3.0"
#endif

namespace cellstash {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.semver = CELLSTASH_VERSION_STRING;
  m.hash_primitive = "blake3 " + hash_library_version();
#if defined(CELLSTASH_WITH_ZSTD)
  m.zstd_enabled = true;
#endif
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"hash_algorithm\":" << m.hash_algorithm
    << ",\"operation_format\":" << m.operation_format
    << ",\"log_format\":" << m.log_format
    << ",\"checkpoint_format\":" << m.checkpoint_format
    << ",\"exchange_format\":" << m.exchange_format
    << ",\"semver\":\"" << m.semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"zstd\":" << (m.zstd_enabled ? "true" : "false")
    << "}";
  return o.str();
}

CompatibilityResult check_compatibility(const std::string& surface, uint32_t found,
                                        uint32_t expected) {
  CompatibilityResult r;
  if (found != expected) {
    r.ok = false;
    r.error_code = "format_version_mismatch";
    r.description = surface + " format version " + std::to_string(found) +
                    " != supported version " + std::to_string(expected);
  }
  return r;
}

}  // namespace version
}  // namespace cellstash
