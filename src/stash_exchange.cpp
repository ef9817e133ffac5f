// Partial-history exchange between parties: NDJSON export/import and merge.

#include <istream>
#include <ostream>

#include "cellstash/operation.hpp"
#include "cellstash/stash.hpp"
#include "cellstash/version.hpp"

namespace cellstash {

bool write_exchange_stream(std::ostream& out, const Articles& articles,
                           const std::vector<Operation>& operations, std::string* error) {
  jsonlite::Object header;
  header["kind"] = jsonlite::Value{std::string("header")};
  header["format"] = jsonlite::Value{static_cast<std::uint64_t>(version::EXCHANGE_FORMAT_VERSION)};
  header["contract_id"] = jsonlite::Value{articles.contract_id};
  header["articles"] = jsonlite::Value{articles_to_object(articles)};
  header["count"] = jsonlite::Value{static_cast<std::uint64_t>(operations.size())};
  out << jsonlite::serialize(header) << '\n';

  for (const auto& op : operations) {
    jsonlite::Object line;
    line["kind"] = jsonlite::Value{std::string("op")};
    line["op"] = jsonlite::Value{operation_to_object(op)};
    out << jsonlite::serialize(line) << '\n';
  }
  out.flush();
  if (!out) {
    if (error) *error = "exchange stream write failed";
    return false;
  }
  return true;
}

bool read_exchange_stream(std::istream& in, ExchangeBundle* bundle, std::string* error) {
  auto fail = [&](const std::string& why) {
    if (error) *error = why;
    return false;
  };

  std::string line;
  size_t line_no = 0;
  bool have_header = false;
  uint64_t declared = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) continue;
    std::optional<jsonlite::JsonError> err;
    auto obj = jsonlite::parse(line, &err);
    if (err) return fail("line " + std::to_string(line_no) + ": " + err->code + ": " + err->message);
    const std::string kind = jsonlite::get_string(obj, "kind");

    if (!have_header) {
      if (kind != "header") return fail("exchange stream must start with a header");
      auto compat = version::check_compatibility(
          "exchange", static_cast<uint32_t>(jsonlite::get_u64(obj, "format", 0)),
          version::EXCHANGE_FORMAT_VERSION);
      if (!compat.ok) return fail(compat.description);
      const auto* articles = jsonlite::get_object(obj, "articles");
      if (!articles) return fail("header carries no articles");
      std::string articles_error;
      auto parsed = articles_from_object(*articles, &articles_error);
      if (!parsed) return fail("header articles: " + articles_error);
      if (parsed->contract_id != jsonlite::get_string(obj, "contract_id")) {
        return fail("header contract_id does not match its articles");
      }
      bundle->articles = std::move(*parsed);
      declared = jsonlite::get_u64(obj, "count", 0);
      have_header = true;
      continue;
    }

    if (kind != "op") return fail("line " + std::to_string(line_no) + ": unexpected kind " + kind);
    const auto* op_obj = jsonlite::get_object(obj, "op");
    if (!op_obj) return fail("line " + std::to_string(line_no) + ": op record without op");
    std::string op_error;
    auto op = operation_from_object(*op_obj, &op_error);
    if (!op) return fail("line " + std::to_string(line_no) + ": " + op_error);
    bundle->operations.push_back(std::move(*op));
  }
  if (!have_header) return fail("empty exchange stream");
  if (declared != bundle->operations.size()) {
    return fail("stream truncated: header declares " + std::to_string(declared) + " operations, got " +
                std::to_string(bundle->operations.size()));
  }
  return true;
}

bool Stash::export_subset(const std::vector<OpId>& terminals, std::ostream& out,
                          std::string* error) const {
  auto ids = subset(terminals, error);
  if (!ids) return false;
  std::vector<Operation> ops;
  ops.reserve(ids->size());
  for (const auto& id : *ids) {
    if (id == articles_.genesis_opid()) continue;
    if (auto op = get(id)) ops.push_back(std::move(*op));
  }
  return write_exchange_stream(out, articles_, ops, error);
}

bool Stash::export_all(std::ostream& out, std::string* error) const {
  std::vector<Operation> ops;
  for (const auto& id : order_) {
    if (id == articles_.genesis_opid()) continue;
    if (auto op = get(id)) ops.push_back(std::move(*op));
  }
  for (const auto& id : pending()) {
    if (auto op = get(id)) ops.push_back(std::move(*op));
  }
  return write_exchange_stream(out, articles_, ops, error);
}

bool Stash::import_bundle(const ExchangeBundle& bundle, ImportReport* report, std::string* error) {
  ImportReport local;
  ImportReport& r = report ? *report : local;
  r = ImportReport{};

  if (bundle.articles.contract_id != articles_.contract_id) {
    if (error) *error = to_string(ErrorCode::contract_mismatch) + ": bundle is for " + bundle.articles.contract_id;
    return false;
  }
  for (const auto& op : bundle.operations) {
    ++r.received;
    const SubmitReport s = submit(op);
    if (s.error_code == ErrorCode::contract_halted || is_fatal(s.error_code)) {
      if (error) *error = to_string(s.error_code) + ": " + s.detail;
      return false;
    }
    switch (s.put) {
      case PutStatus::accepted_new: ++r.accepted_new; break;
      case PutStatus::already_present: ++r.already_present; break;
      case PutStatus::malformed: ++r.malformed; break;
    }
  }
  r.commit = commit();
  if (!r.commit.ok()) {
    if (error) *error = to_string(r.commit.error_code) + ": " + r.commit.detail;
    return false;
  }
  return true;
}

bool Stash::import_stream(std::istream& in, ImportReport* report, std::string* error) {
  ExchangeBundle bundle;
  if (!read_exchange_stream(in, &bundle, error)) return false;
  return import_bundle(bundle, report, error);
}

bool Stash::merge(const Stash& other, CommitReport* report, std::string* error) {
  ExchangeBundle bundle;
  bundle.articles = other.articles();
  for (const auto& id : other.order()) {
    if (id == other.articles().genesis_opid()) continue;
    if (auto op = other.get(id)) bundle.operations.push_back(std::move(*op));
  }
  for (const auto& id : other.pending()) {
    if (auto op = other.get(id)) bundle.operations.push_back(std::move(*op));
  }
  ImportReport r;
  const bool ok = import_bundle(bundle, &r, error);
  if (report) *report = r.commit;
  return ok;
}

}  // namespace cellstash
