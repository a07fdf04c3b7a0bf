#pragma once
#include <warden/schema/add_signer.hpp>
#include <warden/schema/cancel_proposal.hpp>
#include <warden/schema/remove_signer.hpp>
#include <variant>

// Schema type: governance call.
// Governance workflow: payload of a batched call whose target is the wallet
// itself. Only reachable from an executing proposal.
namespace warden::schema {

using governance_call_t =
    std::variant<add_signer_t, remove_signer_t, cancel_proposal_t>;

}  // namespace warden::schema
