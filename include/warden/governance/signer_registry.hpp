#pragma once
#include <warden/governance/governance_token.hpp>
#include <warden/governance/types.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/transaction_error_code.hpp>
#include <warden/schema/wallet_config.hpp>
#include <warden/state/overlay.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace warden::governance {

/// Current authorized signer set of the wallet.
///
/// Stored as an enumeration list plus one membership key per signer, so
/// `is_signer` is a point lookup. Order of the list carries no meaning;
/// removal swaps the last entry into the vacated slot.
class signer_registry final {
 public:
  signer_registry(warden::state::overlay& state, encoder_t& encoder);

  bool is_signer(const warden::schema::signer_id_t& signer) const;
  std::vector<warden::schema::signer_id_t> list() const;
  uint64_t count() const;

  /// Wallet parameters written at genesis, std::nullopt before that.
  std::optional<warden::schema::wallet_config_t> config() const;
  uint32_t max_signers() const;

  /// Fails on a null or duplicate identity, or when the set is full.
  std::optional<warden::schema::transaction_error_t> add_signer(
      const governance_token& token,
      const warden::schema::signer_id_t& signer,
      event_list_t& events);

  /// Fails when the identity is absent or is the last signer.
  std::optional<warden::schema::transaction_error_t> remove_signer(
      const governance_token& token,
      const warden::schema::signer_id_t& signer,
      event_list_t& events);

  /// Install domain, bound and initial signers. Succeeds exactly once.
  std::optional<warden::schema::transaction_error_t> initialize(
      const warden::schema::wallet_genesis_t& genesis,
      event_list_t& events);

 private:
  void store_list(const std::vector<warden::schema::signer_id_t>& signers);

  warden::state::overlay& state_;
  encoder_t& encoder_;
};

}  // namespace warden::governance
