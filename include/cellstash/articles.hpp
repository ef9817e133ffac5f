#pragma once

// cellstash/articles.hpp — Immutable genesis descriptor of a contract.
//
// Articles are created once at contract instantiation and never mutated.
// contract_id = BLAKE3("art:" || canonical articles JSON); the genesis
// operation is derived from the articles and is implicitly accepted at
// position 0 of every stash for this contract.
//
// The articles carry just enough schema for the stash to stay polymorphic
// over contracts: per-method state-name rules (checked by the default
// verifier) and aggregators (read-only projections of global state).

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "cellstash/jsonlite.hpp"
#include "cellstash/types.hpp"

namespace cellstash {

// Which state names a method may consume, read, and produce.
struct MethodRule {
  std::string name;
  std::vector<std::string> consumes;
  std::vector<std::string> reads;
  std::vector<std::string> produces_owned;
  std::vector<std::string> produces_global;
};

enum class AggregatorKind {
  count,     // number of live global cells named `state`
  count_eq,  // ... whose value equals `match`
  sum,       // decimal sum of their values
  set,       // sorted distinct values joined with ','
};

struct Aggregator {
  std::string name;
  AggregatorKind kind{AggregatorKind::count};
  std::string state;
  std::string match;
};

struct Articles {
  std::string name;
  uint64_t version{0};
  uint64_t timestamp{0};
  std::string genesis_method{"genesis"};
  std::map<std::string, MethodRule> methods;
  std::vector<OwnedOutput> genesis_owned;
  std::vector<GlobalOutput> genesis_global;
  std::vector<Aggregator> aggregators;

  // Derived by finalize_articles(); never serialized.
  std::string contract_id;
  Operation genesis;

  const MethodRule* find_method(const std::string& method) const;
  const OpId& genesis_opid() const { return genesis.op_id; }
};

std::string to_string(AggregatorKind kind);
std::optional<AggregatorKind> parse_aggregator_kind(const std::string& text);

std::string canonicalize_articles(const Articles& articles);

// Computes contract_id and the genesis operation. Must be called after the
// descriptive fields are populated and before the articles are used.
void finalize_articles(Articles& articles);

jsonlite::Object articles_to_object(const Articles& articles);
std::string articles_to_json(const Articles& articles);
std::optional<Articles> articles_from_object(const jsonlite::Object& obj, std::string* error);
std::optional<Articles> parse_articles_json(const std::string& json, std::string* error);

}  // namespace cellstash
