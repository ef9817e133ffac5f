#include "cellstash/op_store.hpp"

#include "cellstash/operation.hpp"

namespace cellstash {

PutResult OperationStore::put(const Operation& op) {
  PutResult r;
  std::string detail;
  const ErrorCode code = check_well_formed(op, contract_id_, &detail);
  if (code != ErrorCode::none) {
    r.status = PutStatus::malformed;
    r.error_code = code;
    r.detail = detail;
    return r;
  }
  if (contains(op.op_id)) {
    r.status = PutStatus::already_present;
    return r;
  }

  std::string error;
  if (!persistence_.append_operation(op, &error)) {
    r.status = PutStatus::malformed;
    r.error_code = ErrorCode::persistence_failure;
    r.detail = error;
    return r;
  }
  ops_.emplace(op.op_id, op);
  r.status = PutStatus::accepted_new;
  return r;
}

std::optional<Operation> OperationStore::get(const OpId& op_id) const {
  auto it = ops_.find(op_id);
  if (it == ops_.end()) return std::nullopt;
  return it->second;
}

const Operation* OperationStore::find(const OpId& op_id) const {
  auto it = ops_.find(op_id);
  return it == ops_.end() ? nullptr : &it->second;
}

std::vector<OpId> OperationStore::ids() const {
  std::vector<OpId> out;
  out.reserve(ops_.size());
  for (const auto& [id, op] : ops_) out.push_back(id);
  return out;
}

}  // namespace cellstash
