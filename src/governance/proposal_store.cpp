#include <spdlog/spdlog.h>
#include <warden/governance/events.hpp>
#include <warden/governance/proposal_store.hpp>
#include <warden/governance/vote_ledger.hpp>
#include <warden/schema/key/engine_keys.hpp>

using namespace warden::schema;

namespace warden::governance {

proposal_store::proposal_store(warden::state::overlay& state,
                               encoder_t& encoder,
                               const signer_registry& registry)
    : state_{state}, encoder_{encoder}, registry_{registry} {}

std::variant<proposal_id_t, transaction_error_t> proposal_store::create(
    const signer_id_t& proposer,
    const std::vector<call_t>& calls,
    const timestamp_milliseconds_t expires_at,
    const timestamp_milliseconds_t now,
    vote_ledger& ledger,
    event_list_t& events) {
  if (!registry_.is_signer(proposer)) {
    return transaction_error_t{transaction_error_code::not_a_signer,
                               "proposer is not a signer"};
  }
  if (calls.empty()) {
    return transaction_error_t{transaction_error_code::empty_batch,
                               "proposal has no calls"};
  }
  if (expires_at <= now) {
    return transaction_error_t{
        transaction_error_code::expiration_not_in_future,
        "expiration must be after the current block time"};
  }

  auto proposal_id = count();
  auto seq_key = key::make_proposal_sequence_key(encoder_);
  warden::state::put(encoder_, state_, bytes_view_t{seq_key},
                     uint64_t{proposal_id + 1});

  auto proposal = proposal_state_t{};
  proposal.proposal_id = proposal_id;
  proposal.proposer = proposer;
  proposal.created_at = now;
  proposal.expires_at = expires_at;
  proposal.status = proposal_status_t::proposed;
  proposal.calls = calls;
  store(proposal);
  events.push_back(make_proposal_created_event(proposal_id, proposer,
                                               expires_at, calls.size()));

  if (auto error = ledger.cast_yes(proposal_id, proposer, now, events)) {
    return *error;
  }
  spdlog::debug("Proposal {} created by {} with {} call(s)", proposal_id,
                to_string(proposer), calls.size());
  return proposal_id;
}

std::optional<transaction_error_t> proposal_store::cancel(
    const proposal_id_t proposal_id,
    const signer_id_t& caller,
    event_list_t& events) {
  auto proposal = get(proposal_id);
  if (proposal.status != proposal_status_t::proposed) {
    return transaction_error_t{transaction_error_code::proposal_not_proposed,
                               "proposal is not open"};
  }
  if (proposal.proposer != caller || !registry_.is_signer(caller)) {
    return transaction_error_t{transaction_error_code::not_a_canceller,
                               "only the proposer, while a signer, may cancel"};
  }
  return cancel_proposed(std::move(proposal), events);
}

std::optional<transaction_error_t> proposal_store::cancel(
    const proposal_id_t proposal_id,
    const governance_token& token,
    event_list_t& events) {
  auto proposal = get(proposal_id);
  if (proposal.status != proposal_status_t::proposed) {
    return transaction_error_t{transaction_error_code::proposal_not_proposed,
                               "proposal is not open"};
  }
  spdlog::info("Proposal {} cancels proposal {}", token.proposal_id(),
               proposal_id);
  return cancel_proposed(std::move(proposal), events);
}

proposal_state_t proposal_store::get(const proposal_id_t proposal_id) const {
  auto key = key::make_proposal_key(encoder_, proposal_id);
  auto stored = warden::state::get<proposal_state_t>(encoder_, state_,
                                                     bytes_view_t{key});
  if (stored) {
    return *stored;
  }
  auto missing = proposal_state_t{};
  missing.proposal_id = proposal_id;
  return missing;
}

uint64_t proposal_store::count() const {
  auto key = key::make_proposal_sequence_key(encoder_);
  return warden::state::get<uint64_t>(encoder_, state_, bytes_view_t{key})
      .value_or(0);
}

std::optional<transaction_error_t> proposal_store::mark_executed(
    const governance_token& token) {
  auto proposal = get(token.proposal_id());
  if (proposal.status != proposal_status_t::proposed) {
    return transaction_error_t{transaction_error_code::proposal_not_proposed,
                               "proposal is not open"};
  }
  proposal.status = proposal_status_t::executed;
  store(proposal);
  return std::nullopt;
}

std::optional<transaction_error_t> proposal_store::cancel_proposed(
    proposal_state_t proposal,
    event_list_t& events) {
  proposal.status = proposal_status_t::cancelled;
  store(proposal);
  events.push_back(make_proposal_cancelled_event(proposal.proposal_id));
  return std::nullopt;
}

void proposal_store::store(const proposal_state_t& proposal) {
  auto key = key::make_proposal_key(encoder_, proposal.proposal_id);
  warden::state::put(encoder_, state_, bytes_view_t{key}, proposal);
}

}  // namespace warden::governance
