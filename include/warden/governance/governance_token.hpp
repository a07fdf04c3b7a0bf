#pragma once
#include <warden/schema/primitives.hpp>

namespace warden::governance {

class proposal_executor;

/// Proof that the holder is executing an approved proposal.
///
/// Only `proposal_executor` can mint one, after the majority check has
/// passed. Signer set mutations and governance cancellation require it, so no
/// external identity, current signers included, can reach them directly.
class governance_token final {
 public:
  governance_token(const governance_token&) = delete;
  governance_token& operator=(const governance_token&) = delete;

  warden::schema::proposal_id_t proposal_id() const { return proposal_id_; }

 private:
  friend class proposal_executor;

  explicit governance_token(const warden::schema::proposal_id_t proposal_id)
      : proposal_id_{proposal_id} {}

  warden::schema::proposal_id_t proposal_id_;
};

}  // namespace warden::governance
