#include "cellstash/config.hpp"

#include <charconv>
#include <cstdlib>
#include <set>

#include "cellstash/jsonlite.hpp"

namespace cellstash {

namespace {

bool parse_u64(const std::string& text, uint64_t* out) {
  if (text.empty()) return false;
  const char* first = text.data();
  const char* last = first + text.size();
  auto [ptr, ec] = std::from_chars(first, last, *out);
  return ec == std::errc() && ptr == last;
}

void env_u64(const char* name, uint64_t* field, std::string* error) {
  const char* e = std::getenv(name);
  if (!e || !e[0]) return;
  uint64_t v = 0;
  if (parse_u64(e, &v)) {
    *field = v;
  } else if (error) {
    if (!error->empty()) *error += "; ";
    *error += std::string(name) + " is not an unsigned integer";
  }
}

void env_string(const char* name, std::string* field) {
  const char* e = std::getenv(name);
  if (e && e[0]) *field = e;
}

}  // namespace

std::string StashConfig::to_json() const {
  jsonlite::Object o;
  o["data_dir"] = jsonlite::Value{data_dir};
  o["checkpoint_interval"] = jsonlite::Value{checkpoint_interval};
  o["pending_max"] = jsonlite::Value{pending_max};
  o["pending_ttl_commits"] = jsonlite::Value{pending_ttl_commits};
  o["compression"] = jsonlite::Value{compression};
  o["parallel_verify"] = jsonlite::Value{parallel_verify};
  o["verify_threads"] = jsonlite::Value{static_cast<std::uint64_t>(verify_threads)};
  o["event_log"] = jsonlite::Value{event_log};
  return jsonlite::serialize(o);
}

ConfigValidationResult validate_config(const StashConfig& c) {
  ConfigValidationResult r;
  if (c.compression != "off" && c.compression != "zstd") {
    r.errors.push_back("compression must be \"off\" or \"zstd\"");
  }
#if !defined(CELLSTASH_WITH_ZSTD)
  if (c.compression == "zstd") {
    r.warnings.push_back("built without zstd; checkpoints will be stored uncompressed");
  }
#endif
  if (c.verify_threads > 256) r.errors.push_back("verify_threads must be <= 256");
  if (c.verify_threads > 0 && !c.parallel_verify) {
    r.warnings.push_back("verify_threads has no effect unless parallel_verify is set");
  }
  if (c.pending_max == 0 && c.pending_ttl_commits == 0) {
    r.warnings.push_back("pending pool is unbounded (pending_max = 0, pending_ttl_commits = 0)");
  }
  if (c.checkpoint_interval == 0 && !c.data_dir.empty()) {
    r.warnings.push_back("checkpoints disabled; recovery replays the full order");
  }
  r.ok = r.errors.empty();
  return r;
}

StashConfig config_from_env(StashConfig base, std::string* error) {
  env_string("CELLSTASH_DATA_DIR", &base.data_dir);
  env_u64("CELLSTASH_CHECKPOINT_INTERVAL", &base.checkpoint_interval, error);
  env_u64("CELLSTASH_PENDING_MAX", &base.pending_max, error);
  env_u64("CELLSTASH_PENDING_TTL_COMMITS", &base.pending_ttl_commits, error);
  env_string("CELLSTASH_COMPRESSION", &base.compression);
  env_string("CELLSTASH_EVENT_LOG", &base.event_log);
  if (const char* e = std::getenv("CELLSTASH_PARALLEL_VERIFY")) {
    base.parallel_verify = std::string(e) == "1";
  }
  uint64_t threads = base.verify_threads;
  env_u64("CELLSTASH_VERIFY_THREADS", &threads, error);
  base.verify_threads = static_cast<uint32_t>(threads);
  return base;
}

bool parse_config_json(const std::string& json, StashConfig* config, std::string* error) {
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(json, &err);
  if (err) {
    if (error) *error = err->code + ": " + err->message;
    return false;
  }
  static const std::set<std::string> kKnown = {
      "data_dir", "checkpoint_interval", "pending_max", "pending_ttl_commits",
      "compression", "parallel_verify", "verify_threads", "event_log"};
  for (const auto& [key, value] : obj) {
    if (!kKnown.count(key)) {
      if (error) *error = "unknown config key: " + key;
      return false;
    }
  }
  StashConfig c = *config;
  c.data_dir = jsonlite::get_string(obj, "data_dir", c.data_dir);
  c.checkpoint_interval = jsonlite::get_u64(obj, "checkpoint_interval", c.checkpoint_interval);
  c.pending_max = jsonlite::get_u64(obj, "pending_max", c.pending_max);
  c.pending_ttl_commits = jsonlite::get_u64(obj, "pending_ttl_commits", c.pending_ttl_commits);
  c.compression = jsonlite::get_string(obj, "compression", c.compression);
  c.parallel_verify = jsonlite::get_bool(obj, "parallel_verify", c.parallel_verify);
  c.verify_threads = static_cast<uint32_t>(jsonlite::get_u64(obj, "verify_threads", c.verify_threads));
  c.event_log = jsonlite::get_string(obj, "event_log", c.event_log);
  *config = c;
  return true;
}

}  // namespace cellstash
