#pragma once
#include <warden/governance/governance_token.hpp>
#include <warden/governance/signer_registry.hpp>
#include <warden/governance/types.hpp>
#include <warden/schema/call.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/proposal_state.hpp>
#include <warden/schema/transaction_error_code.hpp>
#include <warden/state/overlay.hpp>
#include <optional>
#include <variant>
#include <vector>

namespace warden::governance {

class vote_ledger;

/// Proposal records and their status transitions.
///
/// Ids are allocated from 0 upward and never reused. A proposal leaves
/// `proposed` exactly once, to `executed` or `cancelled`.
class proposal_store final {
 public:
  proposal_store(warden::state::overlay& state,
                 encoder_t& encoder,
                 const signer_registry& registry);

  /// Store a new proposal and cast the proposer's yes vote through `ledger`.
  std::variant<warden::schema::proposal_id_t,
               warden::schema::transaction_error_t>
  create(const warden::schema::signer_id_t& proposer,
         const std::vector<warden::schema::call_t>& calls,
         warden::schema::timestamp_milliseconds_t expires_at,
         warden::schema::timestamp_milliseconds_t now,
         vote_ledger& ledger,
         event_list_t& events);

  /// Cancel on behalf of an external caller: only the proposer, and only
  /// while the proposer is still a signer.
  std::optional<warden::schema::transaction_error_t> cancel(
      warden::schema::proposal_id_t proposal_id,
      const warden::schema::signer_id_t& caller,
      event_list_t& events);

  /// Cancel from inside an executing proposal.
  std::optional<warden::schema::transaction_error_t> cancel(
      warden::schema::proposal_id_t proposal_id,
      const governance_token& token,
      event_list_t& events);

  /// Unknown ids read as a default record with status `not_started`.
  warden::schema::proposal_state_t get(
      warden::schema::proposal_id_t proposal_id) const;

  /// Number of ids allocated so far.
  uint64_t count() const;

  /// Flip the token's own proposal to `executed`.
  std::optional<warden::schema::transaction_error_t> mark_executed(
      const governance_token& token);

 private:
  std::optional<warden::schema::transaction_error_t> cancel_proposed(
      warden::schema::proposal_state_t proposal,
      event_list_t& events);
  void store(const warden::schema::proposal_state_t& proposal);

  warden::state::overlay& state_;
  encoder_t& encoder_;
  const signer_registry& registry_;
};

}  // namespace warden::governance
