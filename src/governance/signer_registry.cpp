#include <spdlog/spdlog.h>
#include <warden/governance/events.hpp>
#include <warden/governance/signer_registry.hpp>
#include <warden/schema/key/engine_keys.hpp>

#include <algorithm>
#include <iterator>
#include <set>

using namespace warden::schema;

namespace warden::governance {

signer_registry::signer_registry(warden::state::overlay& state,
                                 encoder_t& encoder)
    : state_{state}, encoder_{encoder} {}

bool signer_registry::is_signer(const signer_id_t& signer) const {
  auto key = key::make_signer_key(encoder_, signer);
  return state_.read(bytes_view_t{key}).has_value();
}

std::vector<signer_id_t> signer_registry::list() const {
  auto key = key::make_signer_list_key(encoder_);
  return warden::state::get<std::vector<signer_id_t>>(encoder_, state_,
                                                      bytes_view_t{key})
      .value_or(std::vector<signer_id_t>{});
}

uint64_t signer_registry::count() const {
  return list().size();
}

std::optional<wallet_config_t> signer_registry::config() const {
  auto key = key::make_wallet_config_key(encoder_);
  return warden::state::get<wallet_config_t>(encoder_, state_,
                                             bytes_view_t{key});
}

uint32_t signer_registry::max_signers() const {
  auto current = config();
  return current ? current->max_signers : kDefaultMaxSigners;
}

std::optional<transaction_error_t> signer_registry::add_signer(
    const governance_token& token,
    const signer_id_t& signer,
    event_list_t& events) {
  if (is_null_signer(signer)) {
    return transaction_error_t{transaction_error_code::null_signer,
                               "null signer identity"};
  }
  if (is_signer(signer)) {
    return transaction_error_t{transaction_error_code::duplicate_signer,
                               "signer already present"};
  }
  auto signers = list();
  if (signers.size() >= max_signers()) {
    return transaction_error_t{transaction_error_code::signer_limit_reached,
                               "signer set is full"};
  }

  signers.push_back(signer);
  store_list(signers);
  auto key = key::make_signer_key(encoder_, signer);
  warden::state::put(encoder_, state_, bytes_view_t{key}, true);
  events.push_back(make_signer_added_event(signer));
  spdlog::info("Proposal {} added signer {}", token.proposal_id(),
               to_string(signer));
  return std::nullopt;
}

std::optional<transaction_error_t> signer_registry::remove_signer(
    const governance_token& token,
    const signer_id_t& signer,
    event_list_t& events) {
  if (!is_signer(signer)) {
    return transaction_error_t{transaction_error_code::signer_missing,
                               "signer not present"};
  }
  auto signers = list();
  if (signers.size() <= 1) {
    return transaction_error_t{transaction_error_code::last_signer,
                               "cannot remove the last signer"};
  }

  auto it = std::find(std::begin(signers), std::end(signers), signer);
  if (it != std::end(signers)) {
    *it = signers.back();
    signers.pop_back();
  }
  store_list(signers);
  auto key = key::make_signer_key(encoder_, signer);
  state_.erase(bytes_view_t{key});
  events.push_back(make_signer_removed_event(signer));
  spdlog::info("Proposal {} removed signer {}", token.proposal_id(),
               to_string(signer));
  return std::nullopt;
}

std::optional<transaction_error_t> signer_registry::initialize(
    const wallet_genesis_t& genesis,
    event_list_t& events) {
  if (config().has_value()) {
    return transaction_error_t{
        transaction_error_code::wallet_already_initialized,
        "wallet already initialized"};
  }
  if (genesis.signers.empty() || genesis.max_signers == 0 ||
      genesis.signers.size() > genesis.max_signers) {
    return transaction_error_t{transaction_error_code::invalid_genesis,
                               "initial signer count out of bounds"};
  }
  auto seen = std::set<signer_id_t>{};
  for (const auto& signer : genesis.signers) {
    if (is_null_signer(signer)) {
      return transaction_error_t{transaction_error_code::null_signer,
                                 "null signer identity in genesis"};
    }
    if (!seen.insert(signer).second) {
      return transaction_error_t{transaction_error_code::duplicate_signer,
                                 "duplicate signer in genesis"};
    }
  }

  auto config_key = key::make_wallet_config_key(encoder_);
  warden::state::put(encoder_, state_, bytes_view_t{config_key},
                     wallet_config_t{.domain = genesis.domain,
                                     .max_signers = genesis.max_signers});
  store_list(genesis.signers);
  for (const auto& signer : genesis.signers) {
    auto key = key::make_signer_key(encoder_, signer);
    warden::state::put(encoder_, state_, bytes_view_t{key}, true);
    events.push_back(make_signer_added_event(signer));
  }
  return std::nullopt;
}

void signer_registry::store_list(const std::vector<signer_id_t>& signers) {
  auto key = key::make_signer_list_key(encoder_);
  warden::state::put(encoder_, state_, bytes_view_t{key}, signers);
}

}  // namespace warden::governance
