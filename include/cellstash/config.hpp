#pragma once

// cellstash/config.hpp — Stash configuration.
//
// Sources, lowest to highest precedence:
//   1. Compiled defaults (StashConfig{}).
//   2. A JSON config document (parse_config_json).
//   3. CELLSTASH_* environment variables (config_from_env).
//
// Environment variables:
//   CELLSTASH_DATA_DIR              persistence directory ("" = in-memory)
//   CELLSTASH_CHECKPOINT_INTERVAL   accepted ops between checkpoints (0 = never)
//   CELLSTASH_PENDING_MAX           max pending ops retained (0 = unbounded)
//   CELLSTASH_PENDING_TTL_COMMITS   commit rounds a pending op survives (0 = forever)
//   CELLSTASH_COMPRESSION           "off" | "zstd" for checkpoint blobs
//   CELLSTASH_PARALLEL_VERIFY       "1" to pre-verify the ready frontier concurrently
//   CELLSTASH_VERIFY_THREADS        worker count for pre-verification (0 = hardware)
//   CELLSTASH_EVENT_LOG             JSONL event sink path
//
// Retention defaults are bounded. Unbounded pending retention must be asked
// for explicitly with 0.

#include <cstdint>
#include <string>
#include <vector>

namespace cellstash {

struct StashConfig {
  std::string data_dir;
  uint64_t checkpoint_interval{64};
  uint64_t pending_max{4096};
  uint64_t pending_ttl_commits{1024};
  std::string compression{"off"};
  bool parallel_verify{false};
  uint32_t verify_threads{0};
  std::string event_log;

  std::string to_json() const;
};

struct ConfigValidationResult {
  bool ok{false};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

ConfigValidationResult validate_config(const StashConfig& config);

// Applies CELLSTASH_* variables on top of `base`. Unparseable numbers are
// reported in *error and leave the field unchanged.
StashConfig config_from_env(StashConfig base = {}, std::string* error = nullptr);

// Applies a JSON object on top of `base`. Unknown keys are errors.
bool parse_config_json(const std::string& json, StashConfig* config, std::string* error);

}  // namespace cellstash
