#pragma once
#include <warden/schema/add_signer.hpp>
#include <warden/schema/cancel_proposal.hpp>
#include <warden/schema/cancel_vote_for.hpp>
#include <warden/schema/execute_proposal.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/propose.hpp>
#include <warden/schema/remove_signer.hpp>
#include <warden/schema/vote_for.hpp>
#include <warden/schema/vote_on_behalf_of.hpp>
#include <variant>

namespace warden::schema {

using transaction_payload_t = std::variant<propose_t,
                                           vote_for_t,
                                           cancel_vote_for_t,
                                           vote_on_behalf_of_t,
                                           execute_proposal_t,
                                           cancel_proposal_t,
                                           add_signer_t,
                                           remove_signer_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t sequence{};
  signer_id_t signer{};
  transaction_payload_t payload{};
  signature_t signature;
};

using transaction_t = transaction<1>;

}  // namespace warden::schema
