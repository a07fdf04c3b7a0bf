#pragma once
#include <warden/schema/primitives.hpp>

// Schema type: vote on behalf of.
// Governance workflow: relayed vote; the submitter is irrelevant, the voter
// authenticated by signature over the domain-bound vote digest.
namespace warden::schema {

template <uint16_t Version>
struct vote_on_behalf_of;

template <>
struct vote_on_behalf_of<1> final {
  uint16_t version{1};
  proposal_id_t proposal_id{};
  signer_id_t voter{};
  bool support{true};
  bytes_t signature;
};

using vote_on_behalf_of_t = vote_on_behalf_of<1>;

}  // namespace warden::schema
