#include "cellstash/operation.hpp"

#include <set>

#include "cellstash/hash.hpp"

namespace cellstash {

namespace {

constexpr size_t kMaxOutputs = 0xFFFF;

jsonlite::Object body_object(const Operation& op) {
  using jsonlite::Array;
  using jsonlite::Object;
  using jsonlite::Value;

  Array consumed;
  for (const auto& in : op.consumed) {
    Object o;
    o["addr"] = Value{in.addr.to_string()};
    o["witness"] = Value{in.witness};
    consumed.push_back(Value{std::move(o)});
  }
  Array reading;
  for (const auto& addr : op.reading) reading.push_back(Value{addr.to_string()});
  Array owned;
  for (const auto& out : op.owned_out) {
    Object o;
    o["name"] = Value{out.name};
    o["owner"] = Value{out.owner};
    o["value"] = Value{out.value};
    owned.push_back(Value{std::move(o)});
  }
  Array global;
  for (const auto& out : op.global_out) {
    Object o;
    o["name"] = Value{out.name};
    o["value"] = Value{out.value};
    global.push_back(Value{std::move(o)});
  }

  Object body;
  body["consumed"] = Value{std::move(consumed)};
  body["contract_id"] = Value{op.contract_id};
  body["global_out"] = Value{std::move(global)};
  body["method"] = Value{op.method};
  body["nonce"] = Value{op.nonce};
  body["owned_out"] = Value{std::move(owned)};
  body["reading"] = Value{std::move(reading)};
  return body;
}

}  // namespace

std::string canonicalize_operation(const Operation& op) {
  return jsonlite::serialize(body_object(op));
}

OpId compute_op_id(const Operation& op) {
  return operation_commitment(canonicalize_operation(op));
}

const OpId& seal(Operation& op) {
  op.op_id = compute_op_id(op);
  return op.op_id;
}

CellAddr owned_addr(const Operation& op, uint32_t index) {
  return CellAddr{op.op_id, index};
}

CellAddr global_addr(const Operation& op, uint32_t index) {
  return CellAddr{op.op_id, static_cast<uint32_t>(op.owned_out.size()) + index};
}

ErrorCode check_well_formed(const Operation& op, const std::string& contract_id,
                            std::string* detail) {
  auto fail = [&](ErrorCode code, const std::string& why) {
    if (detail) *detail = why;
    return code;
  };

  if (!is_hex_digest(op.op_id)) return fail(ErrorCode::malformed_operation, "op_id is not a digest");
  if (compute_op_id(op) != op.op_id) {
    return fail(ErrorCode::malformed_operation, "commitment mismatch");
  }
  if (op.contract_id != contract_id) {
    return fail(ErrorCode::contract_mismatch, "operation belongs to contract " + op.contract_id);
  }
  if (op.method.empty()) return fail(ErrorCode::malformed_operation, "empty method name");
  if (op.owned_out.size() + op.global_out.size() > kMaxOutputs) {
    return fail(ErrorCode::malformed_operation, "too many outputs");
  }

  std::set<CellAddr> seen;
  for (const auto& in : op.consumed) {
    if (in.addr.op_id == op.op_id) return fail(ErrorCode::malformed_operation, "consumes its own output");
    if (!seen.insert(in.addr).second) {
      return fail(ErrorCode::malformed_operation, "cell consumed twice: " + in.addr.to_string());
    }
  }
  for (const auto& addr : op.reading) {
    if (addr.op_id == op.op_id) return fail(ErrorCode::malformed_operation, "reads its own output");
    if (seen.count(addr)) {
      return fail(ErrorCode::malformed_operation, "cell both read and consumed: " + addr.to_string());
    }
  }
  return ErrorCode::none;
}

jsonlite::Object operation_to_object(const Operation& op) {
  auto obj = body_object(op);
  obj["op_id"] = jsonlite::Value{op.op_id};
  return obj;
}

std::string operation_to_json(const Operation& op) {
  return jsonlite::serialize(operation_to_object(op));
}

std::optional<Operation> operation_from_object(const jsonlite::Object& obj, std::string* error) {
  auto fail = [&](const std::string& why) -> std::optional<Operation> {
    if (error) *error = why;
    return std::nullopt;
  };

  Operation op;
  op.op_id = jsonlite::get_string(obj, "op_id");
  op.contract_id = jsonlite::get_string(obj, "contract_id");
  op.method = jsonlite::get_string(obj, "method");
  op.nonce = jsonlite::get_u64(obj, "nonce", 0);

  if (const auto* consumed = jsonlite::get_array(obj, "consumed")) {
    for (const auto& item : *consumed) {
      const auto* o = jsonlite::as_object(item);
      if (!o) return fail("consumed entry is not an object");
      auto addr = parse_cell_addr(jsonlite::get_string(*o, "addr"));
      if (!addr) return fail("consumed entry has invalid addr");
      op.consumed.push_back(Input{*addr, jsonlite::get_string(*o, "witness")});
    }
  }
  for (const auto& text : jsonlite::get_string_array(obj, "reading")) {
    auto addr = parse_cell_addr(text);
    if (!addr) return fail("reading entry has invalid addr: " + text);
    op.reading.push_back(*addr);
  }
  if (const auto* owned = jsonlite::get_array(obj, "owned_out")) {
    for (const auto& item : *owned) {
      const auto* o = jsonlite::as_object(item);
      if (!o) return fail("owned_out entry is not an object");
      op.owned_out.push_back(OwnedOutput{jsonlite::get_string(*o, "name"),
                                         jsonlite::get_string(*o, "owner"),
                                         jsonlite::get_string(*o, "value")});
    }
  }
  if (const auto* global = jsonlite::get_array(obj, "global_out")) {
    for (const auto& item : *global) {
      const auto* o = jsonlite::as_object(item);
      if (!o) return fail("global_out entry is not an object");
      op.global_out.push_back(GlobalOutput{jsonlite::get_string(*o, "name"),
                                           jsonlite::get_string(*o, "value")});
    }
  }
  return op;
}

std::optional<Operation> parse_operation_json(const std::string& json, std::string* error) {
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(json, &err);
  if (err) {
    if (error) *error = err->code + ": " + err->message;
    return std::nullopt;
  }
  return operation_from_object(obj, error);
}

}  // namespace cellstash
