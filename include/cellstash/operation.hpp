#pragma once

// cellstash/operation.hpp — Operation commitment and record codec.
//
// INVARIANTS:
//   - op_id = BLAKE3("op:" || canonicalize_operation(op)). Every field except
//     op_id itself is covered, witnesses included, so flipping any byte of a
//     stored operation yields a different commitment.
//   - canonicalize_operation() is a pure function of content. Two operations
//     with identical content have the same op_id and are the same operation.

#include <optional>
#include <string>

#include "cellstash/jsonlite.hpp"
#include "cellstash/types.hpp"

namespace cellstash {

std::string canonicalize_operation(const Operation& op);
OpId compute_op_id(const Operation& op);

// Computes and stores the commitment. Returns the new op_id.
const OpId& seal(Operation& op);

// Address of the n-th owned (destructible) output of op.
CellAddr owned_addr(const Operation& op, uint32_t index);
// Address of the n-th global output. Global outputs are numbered after the
// owned outputs so both kinds share one index space per operation.
CellAddr global_addr(const Operation& op, uint32_t index);

// Structural checks performed before an operation may enter the graph.
// Returns ErrorCode::none when the operation is well formed.
ErrorCode check_well_formed(const Operation& op, const std::string& contract_id,
                            std::string* detail);

jsonlite::Object operation_to_object(const Operation& op);
std::string operation_to_json(const Operation& op);
std::optional<Operation> operation_from_object(const jsonlite::Object& obj, std::string* error);
std::optional<Operation> parse_operation_json(const std::string& json, std::string* error);

}  // namespace cellstash
