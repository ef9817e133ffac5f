#pragma once

// cellstash/verifier.hpp — Verification collaborator seam.
//
// The stash never interprets contract logic itself. For every operation it
// is about to accept it hands the verifier the operation, the live cells the
// operation consumes and reads, and the articles. The verifier either admits
// the operation and returns the cells it produces, or rejects it.
//
// DESIGN INVARIANTS:
//   1. verify() must be a pure function of its arguments. Ordering and
//      checkpoint replay call it repeatedly and in parallel pre-verification
//      may call it from worker threads.
//   2. Produced cell addresses are derived from op.op_id, never chosen by the
//      verifier.
//
// EXTENSION_POINT: vm_verifier
//   Current: CapabilityVerifier (capability protocol + articles method rules).
//   Upgrade path: a verifier that runs the contract's witness program and
//   checks zero-knowledge proofs, keeping the same VerifyResult contract.

#include <string>
#include <vector>

#include "cellstash/articles.hpp"
#include "cellstash/types.hpp"

namespace cellstash {

struct VerifyResult {
  bool ok{false};
  ErrorCode error_code{ErrorCode::none};
  std::string detail;
  std::vector<Cell> owned;
  std::vector<GlobalCell> global;
};

class IVerifier {
 public:
  virtual ~IVerifier() = default;

  // consumed[i] is the live cell at op.consumed[i].addr; read[i] is the live
  // global cell at op.reading[i].
  virtual VerifyResult verify(const Operation& op, const std::vector<Cell>& consumed,
                              const std::vector<GlobalCell>& read,
                              const Articles& articles) const = 0;
};

// Default verifier: the method must be declared in the articles, every
// consumed/read/produced state name must be allowed by the method rule, and
// every consumed cell's capability must admit the presented witness.
class CapabilityVerifier final : public IVerifier {
 public:
  VerifyResult verify(const Operation& op, const std::vector<Cell>& consumed,
                      const std::vector<GlobalCell>& read,
                      const Articles& articles) const override;
};

// The cells an operation produces, independent of verification. Used for
// the genesis operation, which is accepted by construction.
std::vector<Cell> produced_owned_cells(const Operation& op);
std::vector<GlobalCell> produced_global_cells(const Operation& op);

}  // namespace cellstash
