#include <warden/governance/events.hpp>
#include <warden/governance/vote_ledger.hpp>
#include <warden/schema/key/engine_keys.hpp>

#include <algorithm>
#include <iterator>

using namespace warden::schema;

namespace warden::governance {

vote_ledger::vote_ledger(warden::state::overlay& state,
                         encoder_t& encoder,
                         const signer_registry& registry,
                         const proposal_store& proposals)
    : state_{state},
      encoder_{encoder},
      registry_{registry},
      proposals_{proposals} {}

std::optional<transaction_error_t> vote_ledger::cast_yes(
    const proposal_id_t proposal_id,
    const signer_id_t& voter,
    const timestamp_milliseconds_t now,
    event_list_t& events) {
  auto proposal = proposals_.get(proposal_id);
  if (proposal.status != proposal_status_t::proposed) {
    return transaction_error_t{transaction_error_code::proposal_not_proposed,
                               "proposal is not open"};
  }
  if (now > proposal.expires_at) {
    return transaction_error_t{transaction_error_code::proposal_expired,
                               "proposal expired"};
  }
  if (has_voted_yes(proposal_id, voter)) {
    return transaction_error_t{transaction_error_code::already_voted,
                               "voter already voted yes"};
  }

  auto voters = yes_voter_history(proposal_id);
  voters.push_back(voter);
  store_history(proposal_id, voters);
  auto key = key::make_yes_vote_key(encoder_, proposal_id, voter);
  warden::state::put(encoder_, state_, bytes_view_t{key}, true);
  events.push_back(make_vote_cast_event(proposal_id, voter));
  return std::nullopt;
}

std::optional<transaction_error_t> vote_ledger::retract_yes(
    const proposal_id_t proposal_id,
    const signer_id_t& voter,
    event_list_t& events) {
  if (!has_voted_yes(proposal_id, voter)) {
    return transaction_error_t{transaction_error_code::vote_not_cast,
                               "voter has no yes vote to retract"};
  }
  if (proposals_.get(proposal_id).status != proposal_status_t::proposed) {
    return transaction_error_t{transaction_error_code::proposal_not_proposed,
                               "proposal is not open"};
  }

  auto voters = yes_voter_history(proposal_id);
  auto it = std::find(std::begin(voters), std::end(voters), voter);
  if (it != std::end(voters)) {
    *it = voters.back();
    voters.pop_back();
  }
  store_history(proposal_id, voters);
  auto key = key::make_yes_vote_key(encoder_, proposal_id, voter);
  state_.erase(bytes_view_t{key});
  events.push_back(make_vote_retracted_event(proposal_id, voter));
  return std::nullopt;
}

bool vote_ledger::has_voted_yes(const proposal_id_t proposal_id,
                                const signer_id_t& voter) const {
  auto key = key::make_yes_vote_key(encoder_, proposal_id, voter);
  return state_.read(bytes_view_t{key}).has_value();
}

std::vector<signer_id_t> vote_ledger::yes_voter_history(
    const proposal_id_t proposal_id) const {
  auto key = key::make_yes_voters_key(encoder_, proposal_id);
  return warden::state::get<std::vector<signer_id_t>>(encoder_, state_,
                                                      bytes_view_t{key})
      .value_or(std::vector<signer_id_t>{});
}

uint64_t vote_ledger::valid_yes_count(const proposal_id_t proposal_id) const {
  auto voters = yes_voter_history(proposal_id);
  return static_cast<uint64_t>(
      std::count_if(std::begin(voters), std::end(voters),
                    [&](const signer_id_t& voter) {
                      return registry_.is_signer(voter);
                    }));
}

void vote_ledger::store_history(const proposal_id_t proposal_id,
                                const std::vector<signer_id_t>& voters) {
  auto key = key::make_yes_voters_key(encoder_, proposal_id);
  warden::state::put(encoder_, state_, bytes_view_t{key}, voters);
}

}  // namespace warden::governance
