#include "cellstash/persistence.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>

#include "cellstash/operation.hpp"
#include "cellstash/version.hpp"

namespace fs = std::filesystem;

namespace cellstash {

// ---------------------------------------------------------------------------
// MemoryPersistence
// ---------------------------------------------------------------------------

bool MemoryPersistence::take_write(std::string* error) {
  if (fail_after_ == 0) {
    if (error) *error = "injected write failure";
    return false;
  }
  if (fail_after_ > 0) --fail_after_;
  return true;
}

bool MemoryPersistence::write_articles(const Articles& articles, std::string* error) {
  if (articles_) {
    if (articles_->contract_id != articles.contract_id) {
      if (error) *error = "store already holds contract " + articles_->contract_id;
      return false;
    }
    return true;
  }
  if (!take_write(error)) return false;
  articles_ = articles;
  return true;
}

bool MemoryPersistence::append_operation(const Operation& op, std::string* error) {
  if (!take_write(error)) return false;
  journal_.push_back(JournalEntry{JournalEntry::Kind::operation, op, op.op_id});
  return true;
}

bool MemoryPersistence::append_eviction(const OpId& op_id, const std::string&, std::string* error) {
  if (!take_write(error)) return false;
  journal_.push_back(JournalEntry{JournalEntry::Kind::eviction, Operation{}, op_id});
  return true;
}

bool MemoryPersistence::append_verdict(const OpId& op_id, ErrorCode code, const std::string& detail,
                                       std::string* error) {
  if (!take_write(error)) return false;
  journal_.push_back(JournalEntry{JournalEntry::Kind::verdict, Operation{}, op_id, code, detail});
  return true;
}

bool MemoryPersistence::append_order(const OrderEntry& entry, std::string* error) {
  if (!take_write(error)) return false;
  order_.push_back(entry);
  return true;
}

bool MemoryPersistence::checkpoint(const StateSnapshot& snapshot, const OpId& up_to,
                                   std::string* error) {
  if (!take_write(error)) return false;
  checkpoint_ = CheckpointRecord{snapshot.position, up_to, snapshot_digest(snapshot), snapshot};
  ++checkpoints_;
  return true;
}

bool MemoryPersistence::load(LoadedStash* out, std::string*) {
  *out = LoadedStash{};
  out->articles = articles_;
  out->journal = journal_;
  out->order = order_;
  out->checkpoint = checkpoint_;
  return true;
}

// ---------------------------------------------------------------------------
// FilePersistence
// ---------------------------------------------------------------------------

namespace {

std::optional<std::string> read_text(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) return std::nullopt;
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

}  // namespace

FilePersistence::FilePersistence(std::string dir, std::string compression)
    : dir_(std::move(dir)),
      compression_(std::move(compression)),
      operations_((fs::path(dir_) / "operations.ndjson").string()),
      order_((fs::path(dir_) / "order.ndjson").string()),
      blobs_((fs::path(dir_) / "checkpoints").string()) {}

bool FilePersistence::ensure_open(std::string* error) {
  if (opened_) return true;
  LoadedStash scratch;
  return load(&scratch, error);
}

bool FilePersistence::write_articles(const Articles& articles, std::string* error) {
  const fs::path path = fs::path(dir_) / "articles.json";
  std::error_code ec;
  if (fs::exists(path, ec)) {
    auto text = read_text(path);
    std::string parse_error;
    auto existing = text ? parse_articles_json(*text, &parse_error) : std::nullopt;
    if (!existing) {
      if (error) *error = "existing articles.json unreadable: " + parse_error;
      return false;
    }
    if (existing->contract_id != articles.contract_id) {
      if (error) *error = "store already holds contract " + existing->contract_id;
      return false;
    }
    return true;
  }
  return atomic_write_file(path.string(), articles_to_json(articles) + "\n", error);
}

bool FilePersistence::append_operation(const Operation& op, std::string* error) {
  if (!ensure_open(error)) return false;
  jsonlite::Object body;
  body["op"] = jsonlite::Value{operation_to_object(op)};
  return operations_.append("op", body, error);
}

bool FilePersistence::append_eviction(const OpId& op_id, const std::string& reason,
                                      std::string* error) {
  if (!ensure_open(error)) return false;
  jsonlite::Object body;
  body["op_id"] = jsonlite::Value{op_id};
  body["reason"] = jsonlite::Value{reason};
  return operations_.append("evict", body, error);
}

bool FilePersistence::append_verdict(const OpId& op_id, ErrorCode code, const std::string& detail,
                                     std::string* error) {
  if (!ensure_open(error)) return false;
  jsonlite::Object body;
  body["op_id"] = jsonlite::Value{op_id};
  body["error_code"] = jsonlite::Value{to_string(code)};
  body["detail"] = jsonlite::Value{detail};
  return operations_.append("reject", body, error);
}

bool FilePersistence::append_order(const OrderEntry& entry, std::string* error) {
  if (!ensure_open(error)) return false;
  jsonlite::Object body;
  body["op_id"] = jsonlite::Value{entry.op_id};
  body["position"] = jsonlite::Value{entry.position};
  return order_.append("accept", body, error);
}

bool FilePersistence::checkpoint(const StateSnapshot& snapshot, const OpId& up_to,
                                 std::string* error) {
  const std::string blob = blobs_.put(snapshot_to_json(snapshot), compression_);
  if (blob.empty()) {
    if (error) *error = "checkpoint blob write failed";
    return false;
  }
  jsonlite::Object head;
  head["format"] = jsonlite::Value{static_cast<std::uint64_t>(version::CHECKPOINT_FORMAT_VERSION)};
  head["blob"] = jsonlite::Value{blob};
  head["digest"] = jsonlite::Value{snapshot_digest(snapshot)};
  head["position"] = jsonlite::Value{snapshot.position};
  head["up_to"] = jsonlite::Value{up_to};
  return atomic_write_file((fs::path(dir_) / "checkpoint.head").string(),
                           jsonlite::serialize(head) + "\n", error);
}

bool FilePersistence::load(LoadedStash* out, std::string* error) {
  *out = LoadedStash{};
  auto corrupt = [&](const std::string& why) {
    out->failure = ErrorCode::integrity_violation;
    if (error) *error = why;
    return false;
  };
  std::error_code ec;
  fs::create_directories(dir_, ec);
  if (ec) {
    if (error) *error = "cannot create " + dir_ + ": " + ec.message();
    return false;
  }

  const fs::path articles_path = fs::path(dir_) / "articles.json";
  if (fs::exists(articles_path, ec)) {
    auto text = read_text(articles_path);
    std::string parse_error;
    if (!text || !(out->articles = parse_articles_json(*text, &parse_error))) {
      return corrupt("articles.json: " + parse_error);
    }
  }

  std::vector<LogRecord> records;
  LogOpenReport report;
  if (!operations_.open(&records, &report, error)) {
    out->failure = report.chain_broken ? ErrorCode::integrity_violation : ErrorCode::persistence_failure;
    return false;
  }
  out->torn_tail_dropped = report.torn_tail_dropped;
  for (const auto& rec : records) {
    if (rec.kind == "op") {
      const auto* obj = jsonlite::get_object(rec.body, "op");
      std::string op_error;
      auto op = obj ? operation_from_object(*obj, &op_error) : std::nullopt;
      if (!op) return corrupt("operations.ndjson record " + std::to_string(rec.seq) + ": " + op_error);
      OpId id = op->op_id;
      out->journal.push_back(JournalEntry{JournalEntry::Kind::operation, std::move(*op), std::move(id)});
    } else if (rec.kind == "evict") {
      out->journal.push_back(JournalEntry{JournalEntry::Kind::eviction, Operation{},
                                          jsonlite::get_string(rec.body, "op_id")});
    } else if (rec.kind == "reject") {
      auto code = parse_error_code(jsonlite::get_string(rec.body, "error_code"));
      if (!code || *code == ErrorCode::none) {
        return corrupt("operations.ndjson record " + std::to_string(rec.seq) + ": bad verdict code");
      }
      out->journal.push_back(JournalEntry{JournalEntry::Kind::verdict, Operation{},
                                          jsonlite::get_string(rec.body, "op_id"), *code,
                                          jsonlite::get_string(rec.body, "detail")});
    } else {
      return corrupt("operations.ndjson: unknown record kind " + rec.kind);
    }
  }

  records.clear();
  report = LogOpenReport{};
  if (!order_.open(&records, &report, error)) {
    out->failure = report.chain_broken ? ErrorCode::integrity_violation : ErrorCode::persistence_failure;
    return false;
  }
  out->torn_tail_dropped = out->torn_tail_dropped || report.torn_tail_dropped;
  for (const auto& rec : records) {
    if (rec.kind != "accept") return corrupt("order.ndjson: unknown record kind " + rec.kind);
    out->order.push_back(
        OrderEntry{jsonlite::get_string(rec.body, "op_id"), jsonlite::get_u64(rec.body, "position", 0)});
  }
  opened_ = true;

  const fs::path head_path = fs::path(dir_) / "checkpoint.head";
  if (fs::exists(head_path, ec)) {
    auto text = read_text(head_path);
    std::optional<jsonlite::JsonError> err;
    auto head = text ? jsonlite::parse(*text, &err) : jsonlite::Object{};
    if (!text || err) return corrupt("checkpoint.head unreadable");
    auto compat = version::check_compatibility(
        "checkpoint", static_cast<uint32_t>(jsonlite::get_u64(head, "format", 0)),
        version::CHECKPOINT_FORMAT_VERSION);
    if (!compat.ok) return corrupt(compat.description);
    auto blob = blobs_.get(jsonlite::get_string(head, "blob"));
    if (!blob) return corrupt("checkpoint blob missing or corrupt");
    std::string snap_error;
    auto snapshot = snapshot_from_json(*blob, &snap_error);
    if (!snapshot) return corrupt("checkpoint: " + snap_error);
    CheckpointRecord cp;
    cp.position = jsonlite::get_u64(head, "position", 0);
    cp.up_to = jsonlite::get_string(head, "up_to");
    cp.digest = jsonlite::get_string(head, "digest");
    cp.snapshot = std::move(*snapshot);
    out->checkpoint = std::move(cp);
  }
  return true;
}

std::unique_ptr<IStashPersistence> make_persistence(const std::string& dir,
                                                    const std::string& compression) {
  if (dir.empty()) return std::make_unique<MemoryPersistence>();
  return std::make_unique<FilePersistence>(dir, compression);
}

}  // namespace cellstash
