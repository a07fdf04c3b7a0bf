#pragma once
#include <warden/schema/call.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/proposal_status.hpp>
#include <vector>

// Schema type: proposal state.
// Governance workflow: stored proposal. Proposer and calls are frozen once the
// status leaves proposed.
namespace warden::schema {

template <uint16_t Version>
struct proposal_state;

template <>
struct proposal_state<1> final {
  uint16_t version{1};
  proposal_id_t proposal_id{};
  signer_id_t proposer{};
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t expires_at{};
  proposal_status_t status{proposal_status_t::not_started};
  std::vector<call_t> calls;
};

using proposal_state_t = proposal_state<1>;

}  // namespace warden::schema
