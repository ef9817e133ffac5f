#pragma once

// cellstash/types.hpp — Core data structures of the stash.
//
// MEMORY OWNERSHIP:
//   - Every type here is a value type. Operations refer to each other only by
//     op_id (content address), never by pointer, so the dependency graph can
//     hold arbitrary DAG shapes without lifetime cycles.
//   - Cells are addressed by (producer op_id, output index). The address is
//     derived from the producer's commitment, so it is known to a consumer
//     before the producer itself has arrived.
//
// DETERMINISM GUARANTEES:
//   - All keyed containers are ordered (std::map / std::set) so iteration
//     order is a function of content only.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cellstash {

enum class ErrorCode {
  none,
  json_parse_error,
  json_duplicate_key,
  malformed_operation,
  contract_mismatch,
  unresolved_dependency,
  conflicting_consumption,
  verification_failure,
  rejected_ancestor,
  pending_evicted,
  integrity_violation,
  persistence_failure,
  contract_halted,
  articles_invalid,
  config_invalid,
  unknown_operation,
};

std::string to_string(ErrorCode code);
std::optional<ErrorCode> parse_error_code(const std::string& text);

// True for the contract-wide failures that halt ordering and evaluation.
bool is_fatal(ErrorCode code);

// Result of Operation Store put().
enum class PutStatus {
  accepted_new,
  already_present,
  malformed,
};

std::string to_string(PutStatus status);

// Per-operation classification inside the stash.
//   pending  -> ready -> accepted              (terminal)
//   pending/ready -> conflicted | rejected     (terminal)
enum class OpStatus {
  unknown,
  pending,
  ready,
  accepted,
  conflicted,
  rejected,
};

std::string to_string(OpStatus status);

using OpId = std::string;

struct CellAddr {
  OpId op_id;
  uint32_t index{0};

  std::string to_string() const;

  bool operator==(const CellAddr& o) const { return op_id == o.op_id && index == o.index; }
  bool operator!=(const CellAddr& o) const { return !(*this == o); }
  bool operator<(const CellAddr& o) const {
    return op_id != o.op_id ? op_id < o.op_id : index < o.index;
  }
};

// Parses "<64-hex op_id>:<index>".
std::optional<CellAddr> parse_cell_addr(const std::string& text);

// Destructible cell: single-use, guarded by its owner's capability.
struct Cell {
  CellAddr addr;
  std::string name;
  std::string owner;  // capability token (hex)
  std::string value;

  bool operator==(const Cell& o) const {
    return addr == o.addr && name == o.name && owner == o.owner && value == o.value;
  }
};

// Immutable cell: append-only contract state, readable but never consumed.
struct GlobalCell {
  CellAddr addr;
  std::string name;
  std::string value;

  bool operator==(const GlobalCell& o) const {
    return addr == o.addr && name == o.name && value == o.value;
  }
};

struct Input {
  CellAddr addr;
  std::string witness;
};

struct OwnedOutput {
  std::string name;
  std::string owner;
  std::string value;
};

struct GlobalOutput {
  std::string name;
  std::string value;
};

struct Operation {
  OpId op_id;               // commitment over every field below
  std::string contract_id;
  std::string method;
  uint64_t nonce{0};
  std::vector<Input> consumed;
  std::vector<CellAddr> reading;
  std::vector<OwnedOutput> owned_out;
  std::vector<GlobalOutput> global_out;
};

// The cells an accepted operation destroyed. Kept for spent_by() and
// descendants() queries.
struct Transition {
  OpId op_id;
  std::map<CellAddr, Cell> destroyed;
};

}  // namespace cellstash
