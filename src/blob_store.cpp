#include "cellstash/blob_store.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>

#include <fcntl.h>
#include <unistd.h>

#if defined(CELLSTASH_WITH_ZSTD)
#include <zstd.h>
#endif

#include "cellstash/hash.hpp"
#include "cellstash/jsonlite.hpp"

namespace fs = std::filesystem;

namespace cellstash {

namespace {

#if defined(CELLSTASH_WITH_ZSTD)
std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

std::optional<std::string> decompress_zstd(const std::string& data, std::size_t original_size) {
  std::string out;
  out.resize(original_size);
  size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n)) return std::nullopt;
  out.resize(n);
  return out;
}
#endif

std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  return (dir / (".tmp_" + std::to_string(rng()))).string();
}

bool sync_file(const std::string& path) {
  int fd = ::open(path.c_str(), O_RDONLY);
  if (fd < 0) return false;
  const bool ok = ::fsync(fd) == 0;
  ::close(fd);
  return ok;
}

std::optional<std::string> read_file(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) return std::nullopt;
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

}  // namespace

bool atomic_write_file(const std::string& target, const std::string& data, std::string* error) {
  const fs::path path(target);
  std::error_code ec;
  if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);
  if (ec) {
    if (error) *error = "cannot create directory for " + target + ": " + ec.message();
    return false;
  }
  const std::string tmp = make_tmp_name(path.has_parent_path() ? path.parent_path() : fs::path("."));
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      if (error) *error = "cannot create " + tmp;
      return false;
    }
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!ofs) {
      std::remove(tmp.c_str());
      if (error) *error = "short write to " + tmp;
      return false;
    }
  }
  if (!sync_file(tmp)) {
    std::remove(tmp.c_str());
    if (error) *error = "fsync failed for " + tmp;
    return false;
  }
  fs::rename(tmp, path, ec);
  if (ec) {
    std::remove(tmp.c_str());
    if (error) *error = "rename to " + target + " failed: " + ec.message();
    return false;
  }
  return true;
}

BlobStore::BlobStore(std::string root) : root_(std::move(root)) {}

std::string BlobStore::object_path(const std::string& digest) const {
  return (fs::path(root_) / digest.substr(0, 2) / digest.substr(2, 2) / digest).string();
}

std::string BlobStore::meta_path(const std::string& digest) const {
  return object_path(digest) + ".meta";
}

std::string BlobStore::put(const std::string& data, const std::string& compression) {
  const std::string digest = blake3_hex(data);
  if (!is_hex_digest(digest)) return {};

  if (contains(digest)) {
    auto existing = get(digest);
    // A present blob that fails integrity is not silently replaced.
    if (!existing || *existing != data) return {};
    return digest;
  }

  std::string stored = data;
  std::string encoding = "identity";
#if defined(CELLSTASH_WITH_ZSTD)
  if (compression == "zstd") {
    auto c = compress_zstd(data);
    if (!c.empty()) {
      stored = std::move(c);
      encoding = "zstd";
    }
  }
#else
  (void)compression;
#endif

  if (!atomic_write_file(object_path(digest), stored, nullptr)) return {};

  jsonlite::Object meta;
  meta["digest"] = jsonlite::Value{digest};
  meta["encoding"] = jsonlite::Value{encoding};
  meta["original_size"] = jsonlite::Value{static_cast<std::uint64_t>(data.size())};
  meta["stored_size"] = jsonlite::Value{static_cast<std::uint64_t>(stored.size())};
  meta["stored_blob_hash"] = jsonlite::Value{blake3_hex(stored)};
  if (!atomic_write_file(meta_path(digest), jsonlite::serialize(meta), nullptr)) {
    std::error_code ec;
    fs::remove(object_path(digest), ec);
    return {};
  }
  return digest;
}

std::optional<BlobInfo> BlobStore::info(const std::string& digest) const {
  if (!is_hex_digest(digest)) return std::nullopt;
  auto text = read_file(meta_path(digest));
  if (!text) return std::nullopt;
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(*text, &err);
  if (err) return std::nullopt;
  BlobInfo inf;
  inf.digest = jsonlite::get_string(obj, "digest");
  inf.encoding = jsonlite::get_string(obj, "encoding", "identity");
  inf.original_size = static_cast<std::size_t>(jsonlite::get_u64(obj, "original_size", 0));
  inf.stored_size = static_cast<std::size_t>(jsonlite::get_u64(obj, "stored_size", 0));
  inf.stored_blob_hash = jsonlite::get_string(obj, "stored_blob_hash");
  if (inf.digest != digest) return std::nullopt;
  return inf;
}

std::optional<std::string> BlobStore::get(const std::string& digest) const {
  auto meta = info(digest);
  if (!meta) return std::nullopt;
  auto data = read_file(object_path(digest));
  if (!data) return std::nullopt;
  if (blake3_hex(*data) != meta->stored_blob_hash) return std::nullopt;

  if (meta->encoding == "zstd") {
#if defined(CELLSTASH_WITH_ZSTD)
    auto decoded = decompress_zstd(*data, meta->original_size);
    if (!decoded) return std::nullopt;
    data = std::move(decoded);
#else
    // Written by a zstd-enabled build; unreadable here.
    return std::nullopt;
#endif
  } else if (meta->encoding != "identity") {
    return std::nullopt;
  }

  if (blake3_hex(*data) != digest) return std::nullopt;
  return data;
}

bool BlobStore::contains(const std::string& digest) const {
  if (!is_hex_digest(digest)) return false;
  std::error_code ec;
  return fs::exists(object_path(digest), ec) && fs::exists(meta_path(digest), ec);
}

}  // namespace cellstash
