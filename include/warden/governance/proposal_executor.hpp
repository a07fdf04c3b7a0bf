#pragma once
#include <warden/governance/call_target.hpp>
#include <warden/governance/governance_token.hpp>
#include <warden/governance/proposal_store.hpp>
#include <warden/governance/signer_registry.hpp>
#include <warden/governance/types.hpp>
#include <warden/schema/call.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/transaction_error_code.hpp>
#include <warden/state/overlay.hpp>
#include <cstdint>
#include <optional>

namespace warden::governance {

inline constexpr uint32_t kDefaultMaxCallDepth = 8;

/// Runs approved proposals.
///
/// The majority is re-checked against the signer set at execution time:
/// strictly more than half of the current signers must hold a valid yes vote.
/// The status flips to `executed` before the first call so a re-entrant
/// execute of the same proposal fails. Every effect of the batch, the status
/// flip included, lives in a child overlay that is merged only when all calls
/// succeed.
///
/// Calls addressed to the wallet itself carry a SCALE `governance_call_t` and
/// run under a `governance_token` minted for the executing proposal.
class proposal_executor final : public governance_host {
 public:
  proposal_executor(warden::state::overlay& state,
                    encoder_t& encoder,
                    const call_target_registry& targets,
                    warden::schema::timestamp_milliseconds_t now,
                    event_list_t& events,
                    uint32_t max_call_depth = kDefaultMaxCallDepth);

  std::optional<warden::schema::transaction_error_t> execute(
      warden::schema::proposal_id_t proposal_id,
      const warden::schema::signer_id_t& caller) override;

  warden::schema::proposal_state_t proposal(
      warden::schema::proposal_id_t proposal_id) const override;

 private:
  std::optional<warden::schema::transaction_error_t> run_call(
      const warden::schema::call_t& call,
      const governance_token& token,
      warden::state::overlay& batch,
      signer_registry& registry,
      proposal_store& proposals,
      event_list_t& events);

  std::optional<warden::schema::transaction_error_t> run_governance_call(
      const warden::schema::call_t& call,
      const governance_token& token,
      signer_registry& registry,
      proposal_store& proposals,
      event_list_t& events);

  // Innermost running batch; re-entrant executions stack on top of it.
  warden::state::overlay* current_;
  event_list_t* current_events_;
  encoder_t& encoder_;
  const call_target_registry& targets_;
  warden::schema::timestamp_milliseconds_t now_;
  uint32_t max_call_depth_;
  uint32_t depth_{0};
};

}  // namespace warden::governance
