#pragma once

// cellstash/blob_store.hpp — Content-addressed blob storage for checkpoints.
//
// DESIGN INVARIANTS (must not be broken):
//   1. Key = BLAKE3(original bytes), hex. Content-addressed, not
//      location-addressed.
//   2. Writes are atomic: tmp+rename on the same filesystem.
//   3. Reads verify integrity twice: the stored bytes against the .meta
//      sidecar, then the decoded bytes against the key. Any mismatch yields
//      nullopt, never corrupted data.
//   4. put() of content already present returns the same key without
//      rewriting.
//
// Layout:
//   <root>/AB/CD/<64-char-digest>
//   <root>/AB/CD/<64-char-digest>.meta

#include <cstddef>
#include <optional>
#include <string>

namespace cellstash {

struct BlobInfo {
  std::string digest;
  std::string encoding{"identity"};
  std::size_t original_size{0};
  std::size_t stored_size{0};
  std::string stored_blob_hash;
};

// Writes `data` to `target` via a temp file in the same directory and a
// rename. The temp file is fsync'd before the rename.
bool atomic_write_file(const std::string& target, const std::string& data, std::string* error);

class BlobStore {
 public:
  explicit BlobStore(std::string root);

  // compression: "off" or "zstd" (honoured only when built with zstd).
  // Returns the key, or "" on failure.
  std::string put(const std::string& data, const std::string& compression = "off");
  std::optional<std::string> get(const std::string& digest) const;
  std::optional<BlobInfo> info(const std::string& digest) const;
  bool contains(const std::string& digest) const;

  const std::string& root() const { return root_; }

 private:
  std::string object_path(const std::string& digest) const;
  std::string meta_path(const std::string& digest) const;

  std::string root_;
};

}  // namespace cellstash
