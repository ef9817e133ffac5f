#include "cellstash/types.hpp"

#include "cellstash/hash.hpp"

namespace cellstash {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::json_duplicate_key: return "json_duplicate_key";
    case ErrorCode::malformed_operation: return "malformed_operation";
    case ErrorCode::contract_mismatch: return "contract_mismatch";
    case ErrorCode::unresolved_dependency: return "unresolved_dependency";
    case ErrorCode::conflicting_consumption: return "conflicting_consumption";
    case ErrorCode::verification_failure: return "verification_failure";
    case ErrorCode::rejected_ancestor: return "rejected_ancestor";
    case ErrorCode::pending_evicted: return "pending_evicted";
    case ErrorCode::integrity_violation: return "integrity_violation";
    case ErrorCode::persistence_failure: return "persistence_failure";
    case ErrorCode::contract_halted: return "contract_halted";
    case ErrorCode::articles_invalid: return "articles_invalid";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::unknown_operation: return "unknown_operation";
  }
  return "";
}

std::optional<ErrorCode> parse_error_code(const std::string& text) {
  static const ErrorCode kAll[] = {
      ErrorCode::none,
      ErrorCode::json_parse_error,
      ErrorCode::json_duplicate_key,
      ErrorCode::malformed_operation,
      ErrorCode::contract_mismatch,
      ErrorCode::unresolved_dependency,
      ErrorCode::conflicting_consumption,
      ErrorCode::verification_failure,
      ErrorCode::rejected_ancestor,
      ErrorCode::pending_evicted,
      ErrorCode::integrity_violation,
      ErrorCode::persistence_failure,
      ErrorCode::contract_halted,
      ErrorCode::articles_invalid,
      ErrorCode::config_invalid,
      ErrorCode::unknown_operation,
  };
  for (ErrorCode code : kAll) {
    if (to_string(code) == text) return code;
  }
  return std::nullopt;
}

bool is_fatal(ErrorCode code) {
  return code == ErrorCode::integrity_violation || code == ErrorCode::persistence_failure;
}

std::string to_string(PutStatus status) {
  switch (status) {
    case PutStatus::accepted_new: return "accepted_new";
    case PutStatus::already_present: return "already_present";
    case PutStatus::malformed: return "malformed";
  }
  return "";
}

std::string to_string(OpStatus status) {
  switch (status) {
    case OpStatus::unknown: return "unknown";
    case OpStatus::pending: return "pending";
    case OpStatus::ready: return "ready";
    case OpStatus::accepted: return "accepted";
    case OpStatus::conflicted: return "conflicted";
    case OpStatus::rejected: return "rejected";
  }
  return "";
}

std::string CellAddr::to_string() const {
  return op_id + ":" + std::to_string(index);
}

std::optional<CellAddr> parse_cell_addr(const std::string& text) {
  const auto colon = text.find(':');
  if (colon == std::string::npos || colon + 1 >= text.size()) return std::nullopt;
  CellAddr addr;
  addr.op_id = text.substr(0, colon);
  if (!is_hex_digest(addr.op_id)) return std::nullopt;
  const std::string idx = text.substr(colon + 1);
  if (idx.size() > 5) return std::nullopt;
  uint32_t n = 0;
  for (char c : idx) {
    if (c < '0' || c > '9') return std::nullopt;
    n = n * 10 + static_cast<uint32_t>(c - '0');
  }
  if (n > 0xFFFF) return std::nullopt;
  addr.index = n;
  return addr;
}

}  // namespace cellstash
