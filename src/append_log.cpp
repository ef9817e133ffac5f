#include "cellstash/append_log.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>

#include <unistd.h>

#include "cellstash/hash.hpp"

namespace fs = std::filesystem;

namespace cellstash {

namespace {

std::string record_line(uint64_t seq, const std::string& prev, const std::string& kind,
                        const jsonlite::Object& body) {
  jsonlite::Object full = body;
  full["seq"] = jsonlite::Value{static_cast<std::uint64_t>(seq)};
  full["prev"] = jsonlite::Value{prev};
  full["kind"] = jsonlite::Value{kind};
  return jsonlite::serialize(full);
}

}  // namespace

AppendLog::AppendLog(std::string path) : path_(std::move(path)) {}

AppendLog::~AppendLog() {
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

bool AppendLog::open(std::vector<LogRecord>* records, LogOpenReport* report, std::string* error) {
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
  seq_ = 0;
  last_digest_ = kGenesisChainDigest;

  std::string content;
  if (fs::exists(path_)) {
    std::ifstream ifs(path_, std::ios::binary);
    if (!ifs) {
      if (error) *error = "cannot read " + path_;
      return false;
    }
    content.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
  }

  size_t good_end = 0;
  size_t pos = 0;
  bool torn = false;
  while (pos < content.size()) {
    const size_t nl = content.find('\n', pos);
    const bool last = (nl == std::string::npos) || (nl + 1 == content.size());
    if (nl == std::string::npos) {
      // Unterminated final line: the write never completed.
      torn = true;
      break;
    }
    const std::string line = content.substr(pos, nl - pos);

    std::optional<jsonlite::JsonError> err;
    jsonlite::Object obj = jsonlite::parse(line, &err);
    LogRecord rec;
    if (!err) {
      rec.seq = jsonlite::get_u64(obj, "seq", 0);
      rec.prev = jsonlite::get_string(obj, "prev");
      rec.kind = jsonlite::get_string(obj, "kind");
    }
    const bool chain_ok = !err && rec.seq == seq_ + 1 && rec.prev == last_digest_ && !rec.kind.empty() &&
                          record_line(rec.seq, rec.prev, rec.kind, obj) == line;
    if (!chain_ok) {
      if (last) {
        torn = true;
        break;
      }
      if (error) {
        *error = path_ + ": chain broken at record " + std::to_string(seq_ + 1);
      }
      if (report) report->chain_broken = true;
      return false;
    }
    obj.erase("seq");
    obj.erase("prev");
    obj.erase("kind");
    rec.body = std::move(obj);
    seq_ = rec.seq;
    last_digest_ = log_record_digest(line);
    if (records) records->push_back(std::move(rec));
    pos = nl + 1;
    good_end = pos;
  }

  if (torn) {
    std::error_code ec;
    fs::resize_file(path_, good_end, ec);
    if (ec) {
      if (error) *error = "cannot truncate torn tail of " + path_ + ": " + ec.message();
      return false;
    }
  }

  if (report) {
    report->records = seq_;
    report->torn_tail_dropped = torn;
  }

  file_ = std::fopen(path_.c_str(), "ab");
  if (!file_) {
    if (error) *error = "cannot open " + path_ + " for append";
    return false;
  }
  return true;
}

bool AppendLog::append(const std::string& kind, const jsonlite::Object& body, std::string* error) {
  if (!file_) {
    if (error) *error = path_ + ": log not open";
    return false;
  }

  const std::string line = record_line(seq_ + 1, last_digest_, kind, body);
  const std::string framed = line + "\n";

  std::fseek(file_, 0, SEEK_END);
  const long pre_write_pos = std::ftell(file_);
  const bool written = pre_write_pos >= 0 &&
                       std::fwrite(framed.data(), 1, framed.size(), file_) == framed.size() &&
                       std::fflush(file_) == 0 && ::fsync(::fileno(file_)) == 0;
  if (!written) {
    if (error) *error = path_ + ": durable write failed";
    // Roll back a partial write so the next append keeps the chain intact.
    if (pre_write_pos >= 0) {
      std::error_code ec;
      fs::resize_file(path_, static_cast<std::uintmax_t>(pre_write_pos), ec);
    }
    return false;
  }

  seq_ += 1;
  last_digest_ = log_record_digest(line);
  return true;
}

}  // namespace cellstash
