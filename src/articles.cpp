#include "cellstash/articles.hpp"

#include <set>

#include "cellstash/hash.hpp"
#include "cellstash/operation.hpp"

namespace cellstash {

namespace {

jsonlite::Value string_array(const std::vector<std::string>& items) {
  jsonlite::Array arr;
  for (const auto& s : items) arr.push_back(jsonlite::Value{s});
  return jsonlite::Value{std::move(arr)};
}

}  // namespace

const MethodRule* Articles::find_method(const std::string& method) const {
  auto it = methods.find(method);
  return it == methods.end() ? nullptr : &it->second;
}

std::string to_string(AggregatorKind kind) {
  switch (kind) {
    case AggregatorKind::count: return "count";
    case AggregatorKind::count_eq: return "count_eq";
    case AggregatorKind::sum: return "sum";
    case AggregatorKind::set: return "set";
  }
  return "";
}

std::optional<AggregatorKind> parse_aggregator_kind(const std::string& text) {
  if (text == "count") return AggregatorKind::count;
  if (text == "count_eq") return AggregatorKind::count_eq;
  if (text == "sum") return AggregatorKind::sum;
  if (text == "set") return AggregatorKind::set;
  return std::nullopt;
}

jsonlite::Object articles_to_object(const Articles& a) {
  using jsonlite::Array;
  using jsonlite::Object;
  using jsonlite::Value;

  Array methods;
  for (const auto& [name, rule] : a.methods) {
    Object m;
    m["name"] = Value{name};
    m["consumes"] = string_array(rule.consumes);
    m["reads"] = string_array(rule.reads);
    m["produces_owned"] = string_array(rule.produces_owned);
    m["produces_global"] = string_array(rule.produces_global);
    methods.push_back(Value{std::move(m)});
  }

  Array owned;
  for (const auto& c : a.genesis_owned) {
    Object o;
    o["name"] = Value{c.name};
    o["owner"] = Value{c.owner};
    o["value"] = Value{c.value};
    owned.push_back(Value{std::move(o)});
  }
  Array global;
  for (const auto& c : a.genesis_global) {
    Object o;
    o["name"] = Value{c.name};
    o["value"] = Value{c.value};
    global.push_back(Value{std::move(o)});
  }
  Object genesis;
  genesis["method"] = Value{a.genesis_method};
  genesis["owned"] = Value{std::move(owned)};
  genesis["global"] = Value{std::move(global)};

  Array aggregators;
  for (const auto& ag : a.aggregators) {
    Object o;
    o["name"] = Value{ag.name};
    o["kind"] = Value{to_string(ag.kind)};
    o["state"] = Value{ag.state};
    if (ag.kind == AggregatorKind::count_eq) o["match"] = Value{ag.match};
    aggregators.push_back(Value{std::move(o)});
  }

  Object out;
  out["name"] = Value{a.name};
  out["version"] = Value{a.version};
  out["timestamp"] = Value{a.timestamp};
  out["methods"] = Value{std::move(methods)};
  out["genesis"] = Value{std::move(genesis)};
  out["aggregators"] = Value{std::move(aggregators)};
  return out;
}

std::string canonicalize_articles(const Articles& articles) {
  return jsonlite::serialize(articles_to_object(articles));
}

std::string articles_to_json(const Articles& articles) {
  return canonicalize_articles(articles);
}

void finalize_articles(Articles& articles) {
  articles.contract_id = articles_commitment(canonicalize_articles(articles));

  Operation genesis;
  genesis.contract_id = articles.contract_id;
  genesis.method = articles.genesis_method;
  genesis.nonce = articles.timestamp;
  genesis.owned_out = articles.genesis_owned;
  genesis.global_out = articles.genesis_global;
  seal(genesis);
  articles.genesis = std::move(genesis);
}

std::optional<Articles> articles_from_object(const jsonlite::Object& obj, std::string* error) {
  auto fail = [&](const std::string& why) -> std::optional<Articles> {
    if (error) *error = why;
    return std::nullopt;
  };

  Articles a;
  a.name = jsonlite::get_string(obj, "name");
  if (a.name.empty()) return fail("articles.name is required");
  a.version = jsonlite::get_u64(obj, "version", 0);
  a.timestamp = jsonlite::get_u64(obj, "timestamp", 0);

  if (const auto* methods = jsonlite::get_array(obj, "methods")) {
    for (const auto& item : *methods) {
      const auto* m = jsonlite::as_object(item);
      if (!m) return fail("method entry is not an object");
      MethodRule rule;
      rule.name = jsonlite::get_string(*m, "name");
      if (rule.name.empty()) return fail("method without a name");
      rule.consumes = jsonlite::get_string_array(*m, "consumes");
      rule.reads = jsonlite::get_string_array(*m, "reads");
      rule.produces_owned = jsonlite::get_string_array(*m, "produces_owned");
      rule.produces_global = jsonlite::get_string_array(*m, "produces_global");
      if (!a.methods.emplace(rule.name, rule).second) return fail("duplicate method: " + rule.name);
    }
  }

  const auto* genesis = jsonlite::get_object(obj, "genesis");
  if (!genesis) return fail("articles.genesis is required");
  a.genesis_method = jsonlite::get_string(*genesis, "method", "genesis");
  if (a.methods.count(a.genesis_method)) {
    return fail("genesis method may not be callable: " + a.genesis_method);
  }
  if (const auto* owned = jsonlite::get_array(*genesis, "owned")) {
    for (const auto& item : *owned) {
      const auto* o = jsonlite::as_object(item);
      if (!o) return fail("genesis owned entry is not an object");
      OwnedOutput c{jsonlite::get_string(*o, "name"), jsonlite::get_string(*o, "owner"),
                    jsonlite::get_string(*o, "value")};
      if (c.name.empty() || !is_hex_digest(c.owner)) {
        return fail("genesis owned cell needs a name and a capability token");
      }
      a.genesis_owned.push_back(std::move(c));
    }
  }
  if (const auto* global = jsonlite::get_array(*genesis, "global")) {
    for (const auto& item : *global) {
      const auto* o = jsonlite::as_object(item);
      if (!o) return fail("genesis global entry is not an object");
      GlobalOutput c{jsonlite::get_string(*o, "name"), jsonlite::get_string(*o, "value")};
      if (c.name.empty()) return fail("genesis global cell needs a name");
      a.genesis_global.push_back(std::move(c));
    }
  }

  std::set<std::string> aggregator_names;
  if (const auto* aggs = jsonlite::get_array(obj, "aggregators")) {
    for (const auto& item : *aggs) {
      const auto* o = jsonlite::as_object(item);
      if (!o) return fail("aggregator entry is not an object");
      Aggregator ag;
      ag.name = jsonlite::get_string(*o, "name");
      ag.state = jsonlite::get_string(*o, "state");
      ag.match = jsonlite::get_string(*o, "match");
      auto kind = parse_aggregator_kind(jsonlite::get_string(*o, "kind", "count"));
      if (!kind) return fail("unknown aggregator kind for " + ag.name);
      ag.kind = *kind;
      if (ag.name.empty() || ag.state.empty()) return fail("aggregator needs name and state");
      if (!aggregator_names.insert(ag.name).second) return fail("duplicate aggregator: " + ag.name);
      a.aggregators.push_back(std::move(ag));
    }
  }

  finalize_articles(a);
  return a;
}

std::optional<Articles> parse_articles_json(const std::string& json, std::string* error) {
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(json, &err);
  if (err) {
    if (error) *error = err->code + ": " + err->message;
    return std::nullopt;
  }
  return articles_from_object(obj, error);
}

}  // namespace cellstash
