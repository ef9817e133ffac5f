#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "cellstash/articles.hpp"
#include "cellstash/capability.hpp"
#include "cellstash/config.hpp"
#include "cellstash/hash.hpp"
#include "cellstash/jsonlite.hpp"
#include "cellstash/observability.hpp"
#include "cellstash/operation.hpp"
#include "cellstash/persistence.hpp"
#include "cellstash/stash.hpp"
#include "cellstash/state.hpp"
#include "cellstash/verifier.hpp"
#include "cellstash/version.hpp"

namespace {

using cellstash::jsonlite::escape;

bool read_file(const std::string& path, std::string* out) {
  if (path == "-") {
    out->assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return true;
  }
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return false;
  out->assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
  return true;
}

int fail(const std::string& code, const std::string& message, int rc = 1) {
  std::cout << "{\"ok\":false,\"error\":{\"code\":\"" << escape(code) << "\",\"message\":\""
            << escape(message) << "\"}}\n";
  return rc;
}

// Collects "--flag value" pairs; repeated flags keep every value.
struct Args {
  std::vector<std::pair<std::string, std::string>> flags;

  std::string get(const std::string& name, const std::string& def = "") const {
    for (auto it = flags.rbegin(); it != flags.rend(); ++it) {
      if (it->first == name) return it->second;
    }
    return def;
  }
  std::vector<std::string> all(const std::string& name) const {
    std::vector<std::string> out;
    for (const auto& [k, v] : flags) {
      if (k == name) out.push_back(v);
    }
    return out;
  }
  bool has(const std::string& name) const {
    for (const auto& [k, v] : flags) {
      if (k == name) return true;
    }
    return false;
  }
};

Args parse_args(int argc, char** argv, int first) {
  Args a;
  for (int i = first; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg.rfind("--", 0) != 0) continue;
    std::string value;
    if (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) value = argv[++i];
    a.flags.emplace_back(arg.substr(2), value);
  }
  return a;
}

std::string ids_json(const std::vector<std::string>& ids) {
  std::string out = "[";
  for (size_t i = 0; i < ids.size(); ++i) {
    if (i) out += ",";
    out += "\"" + ids[i] + "\"";
  }
  return out + "]";
}

std::string commit_json(const cellstash::CommitReport& c) {
  std::ostringstream o;
  o << "{\"accepted\":" << ids_json(c.accepted) << ",\"conflicted\":" << ids_json(c.conflicted)
    << ",\"rejected\":" << ids_json(c.rejected) << ",\"evicted\":" << ids_json(c.evicted);
  if (!c.ok()) o << ",\"error_code\":\"" << cellstash::to_string(c.error_code) << "\"";
  o << "}";
  return o.str();
}

// Splits "a<sep>b" at the first separator.
bool split_once(const std::string& s, char sep, std::string* a, std::string* b) {
  const size_t p = s.find(sep);
  if (p == std::string::npos) return false;
  *a = s.substr(0, p);
  *b = s.substr(p + 1);
  return true;
}

bool load_config(const Args& args, cellstash::StashConfig* config, std::string* error) {
  if (args.has("config")) {
    std::string text;
    if (!read_file(args.get("config"), &text)) {
      *error = "cannot read config " + args.get("config");
      return false;
    }
    if (!cellstash::parse_config_json(text, config, error)) return false;
  }
  std::string env_error;
  *config = cellstash::config_from_env(*config, &env_error);
  if (!env_error.empty()) {
    *error = env_error;
    return false;
  }
  if (args.has("dir")) config->data_dir = args.get("dir");
  const auto v = cellstash::validate_config(*config);
  for (const auto& w : v.warnings) std::cerr << "[config] warning: " << w << "\n";
  if (!v.ok) {
    *error = v.errors.front();
    return false;
  }
  if (config->data_dir.empty()) {
    *error = "no data directory (--dir or CELLSTASH_DATA_DIR)";
    return false;
  }
  return true;
}

std::unique_ptr<cellstash::Stash> open_stash(const cellstash::StashConfig& config, std::string* error) {
  auto persistence = std::shared_ptr<cellstash::IStashPersistence>(
      cellstash::make_persistence(config.data_dir, config.compression));
  return cellstash::Stash::open_existing(std::move(persistence), config, error);
}

void print_usage() {
  std::cerr << "usage: cellstash <command> [--flags]\n"
               "  init    --dir D --articles FILE\n"
               "  token   --secret S\n"
               "  issue   --dir D --method M [--nonce N] [--consume OPID:IDX=SECRET]...\n"
               "          [--read OPID:IDX]... [--owned NAME:VALUE:SECRET]... [--global NAME:VALUE]...\n"
               "  submit  --dir D --op FILE|-\n"
               "  state   --dir D\n"
               "  order   --dir D\n"
               "  export  --dir D [--terminal OPID]... [--out FILE]\n"
               "  import  --dir D --in FILE|-\n"
               "  verify  --dir D\n"
               "  version\n";
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    print_usage();
    return 1;
  }
  const std::string cmd = argv[1];
  const Args args = parse_args(argc, argv, 2);

  if (cmd == "version") {
    std::cout << cellstash::version::manifest_to_json(cellstash::version::current_manifest()) << "\n";
    return 0;
  }

  if (cmd == "token") {
    if (!args.has("secret")) return fail("usage", "--secret is required");
    std::cout << "{\"token\":\"" << cellstash::auth_token(args.get("secret")) << "\"}\n";
    return 0;
  }

  cellstash::StashConfig config;
  std::string error;
  if (!load_config(args, &config, &error)) return fail("config_invalid", error, 2);

  if (cmd == "init") {
    std::string text;
    if (!read_file(args.get("articles"), &text)) return fail("usage", "cannot read --articles");
    auto articles = cellstash::parse_articles_json(text, &error);
    if (!articles) return fail("articles_invalid", error);
    auto persistence = std::shared_ptr<cellstash::IStashPersistence>(
        cellstash::make_persistence(config.data_dir, config.compression));
    cellstash::Stash stash(std::move(*articles), persistence, config);
    if (!stash.open(&error)) return fail(cellstash::to_string(stash.halt_code()), error);
    std::cout << "{\"ok\":true,\"contract_id\":\"" << stash.contract_id() << "\",\"genesis\":\""
              << stash.articles().genesis_opid() << "\"}\n";
    return 0;
  }

  if (cmd == "import") {
    std::string text;
    if (!read_file(args.get("in", "-"), &text)) return fail("usage", "cannot read --in");
    std::istringstream in(text);
    cellstash::ExchangeBundle bundle;
    if (!cellstash::read_exchange_stream(in, &bundle, &error)) return fail("malformed_operation", error);
    // An empty directory is initialised from the stream's articles.
    auto persistence = std::shared_ptr<cellstash::IStashPersistence>(
        cellstash::make_persistence(config.data_dir, config.compression));
    cellstash::Stash stash(bundle.articles, persistence, config);
    if (!stash.open(&error)) return fail(cellstash::to_string(stash.halt_code()), error);
    cellstash::ImportReport report;
    if (!stash.import_bundle(bundle, &report, &error)) return fail("import_failed", error);
    std::cout << "{\"ok\":true,\"received\":" << report.received
              << ",\"accepted_new\":" << report.accepted_new
              << ",\"already_present\":" << report.already_present
              << ",\"malformed\":" << report.malformed << ",\"commit\":" << commit_json(report.commit)
              << ",\"state_digest\":\"" << stash.state_digest() << "\"}\n";
    return 0;
  }

  auto stash = open_stash(config, &error);
  if (!stash) return fail("open_failed", error);

  if (cmd == "issue") {
    cellstash::Operation op;
    op.contract_id = stash->contract_id();
    op.method = args.get("method");
    op.nonce = std::strtoull(args.get("nonce", "0").c_str(), nullptr, 10);
    for (const auto& arg : args.all("consume")) {
      std::string addr_text, secret;
      if (!split_once(arg, '=', &addr_text, &secret)) return fail("usage", "--consume OPID:IDX=SECRET");
      auto addr = cellstash::parse_cell_addr(addr_text);
      if (!addr) return fail("usage", "bad cell address: " + addr_text);
      op.consumed.push_back(cellstash::Input{*addr, secret});
    }
    for (const auto& arg : args.all("read")) {
      auto addr = cellstash::parse_cell_addr(arg);
      if (!addr) return fail("usage", "bad cell address: " + arg);
      op.reading.push_back(*addr);
    }
    for (const auto& arg : args.all("owned")) {
      std::string name, rest, value, secret;
      if (!split_once(arg, ':', &name, &rest) || !split_once(rest, ':', &value, &secret)) {
        return fail("usage", "--owned NAME:VALUE:SECRET");
      }
      op.owned_out.push_back(cellstash::OwnedOutput{name, cellstash::auth_token(secret), value});
    }
    for (const auto& arg : args.all("global")) {
      std::string name, value;
      if (!split_once(arg, ':', &name, &value)) return fail("usage", "--global NAME:VALUE");
      op.global_out.push_back(cellstash::GlobalOutput{name, value});
    }
    cellstash::seal(op);
    std::cout << cellstash::operation_to_json(op) << "\n";
    return 0;
  }

  if (cmd == "submit") {
    std::string text;
    if (!read_file(args.get("op", "-"), &text)) return fail("usage", "cannot read --op");
    const auto s = stash->submit_json(text);
    const auto c = stash->commit();
    const auto status = stash->status(s.op_id);
    const cellstash::ErrorCode why =
        stash->reason(s.op_id) != cellstash::ErrorCode::none ? stash->reason(s.op_id) : s.error_code;
    std::cout << "{\"ok\":" << (s.put != cellstash::PutStatus::malformed && c.ok() ? "true" : "false")
              << ",\"op_id\":\"" << s.op_id << "\",\"put\":\"" << cellstash::to_string(s.put)
              << "\",\"status\":\"" << cellstash::to_string(status) << "\"";
    if (why != cellstash::ErrorCode::none && status != cellstash::OpStatus::accepted) {
      std::cout << ",\"error_code\":\"" << cellstash::to_string(why) << "\"";
      const std::string detail = stash->reason_detail(s.op_id).empty() ? s.detail : stash->reason_detail(s.op_id);
      if (!detail.empty()) std::cout << ",\"detail\":\"" << escape(detail) << "\"";
    }
    if (!s.missing.empty() && status == cellstash::OpStatus::pending) {
      std::cout << ",\"missing\":" << ids_json(s.missing);
    }
    std::cout << ",\"commit\":" << commit_json(c) << "}\n";
    return s.put == cellstash::PutStatus::malformed ? 2 : (c.ok() ? 0 : 1);
  }

  if (cmd == "state") {
    const auto& snap = stash->state();
    std::cout << "{\"contract_id\":\"" << stash->contract_id() << "\",\"position\":" << snap.position
              << ",\"last_op\":\"" << snap.last_op << "\",\"state_digest\":\"" << stash->state_digest()
              << "\",\"owned_cells\":" << snap.owned.size() << ",\"global_cells\":" << snap.global.size()
              << ",\"aggregates\":{";
    bool first = true;
    for (const auto& [name, value] : stash->aggregates()) {
      if (!first) std::cout << ",";
      first = false;
      std::cout << "\"" << escape(name) << "\":\"" << escape(value) << "\"";
    }
    std::cout << "}}\n";
    return 0;
  }

  if (cmd == "order") {
    std::cout << "{\"order\":" << ids_json(stash->order()) << ",\"pending\":" << ids_json(stash->pending())
              << "}\n";
    return 0;
  }

  if (cmd == "export") {
    std::ostringstream buf;
    const auto terminals = args.all("terminal");
    const bool ok = terminals.empty() ? stash->export_all(buf, &error)
                                      : stash->export_subset(terminals, buf, &error);
    if (!ok) return fail("export_failed", error);
    if (args.has("out")) {
      if (!cellstash::atomic_write_file(args.get("out"), buf.str(), &error)) {
        return fail("persistence_failure", error);
      }
    } else {
      std::cout << buf.str();
    }
    return 0;
  }

  if (cmd == "verify") {
    // Re-evaluate the persisted order from genesis and compare with the
    // recovered state (checkpoint plus replay).
    std::vector<cellstash::Operation> ops;
    for (const auto& id : stash->order()) {
      if (id == stash->articles().genesis_opid()) continue;
      if (auto op = stash->get(id)) ops.push_back(std::move(*op));
    }
    const cellstash::CapabilityVerifier verifier;
    const cellstash::StateEvaluator evaluator(stash->articles(), verifier);
    cellstash::StateSnapshot fresh = cellstash::genesis_snapshot(stash->articles());
    std::string replay_error;
    const bool replayed = evaluator.replay(fresh, ops, &replay_error);
    const bool same_state = replayed && cellstash::snapshot_digest(fresh) == stash->state_digest();
    std::cout << "{\"ok\":" << (same_state ? "true" : "false")
              << ",\"replayed\":" << ops.size() << ",\"state_matches\":" << (same_state ? "true" : "false")
              << ",\"state_digest\":\"" << stash->state_digest() << "\"";
    if (!replayed) std::cout << ",\"detail\":\"" << escape(replay_error) << "\"";
    std::cout << ",\"stats\":" << cellstash::global_stash_stats().to_json() << "}\n";
    return same_state ? 0 : 2;
  }

  print_usage();
  return 1;
}
