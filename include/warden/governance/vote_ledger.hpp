#pragma once
#include <warden/governance/proposal_store.hpp>
#include <warden/governance/signer_registry.hpp>
#include <warden/governance/types.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/transaction_error_code.hpp>
#include <warden/state/overlay.hpp>
#include <optional>
#include <vector>

namespace warden::governance {

/// Per-proposal yes votes.
///
/// The history keeps every voter who said yes and has not retracted, whether
/// or not they are still a signer. Validity is derived at read time by
/// filtering the history through the live signer set; nothing is cached, so a
/// removed and re-added signer gets their vote back without voting again.
class vote_ledger final {
 public:
  vote_ledger(warden::state::overlay& state,
              encoder_t& encoder,
              const signer_registry& registry,
              const proposal_store& proposals);

  std::optional<warden::schema::transaction_error_t> cast_yes(
      warden::schema::proposal_id_t proposal_id,
      const warden::schema::signer_id_t& voter,
      warden::schema::timestamp_milliseconds_t now,
      event_list_t& events);

  std::optional<warden::schema::transaction_error_t> retract_yes(
      warden::schema::proposal_id_t proposal_id,
      const warden::schema::signer_id_t& voter,
      event_list_t& events);

  bool has_voted_yes(warden::schema::proposal_id_t proposal_id,
                     const warden::schema::signer_id_t& voter) const;

  std::vector<warden::schema::signer_id_t> yes_voter_history(
      warden::schema::proposal_id_t proposal_id) const;

  uint64_t valid_yes_count(warden::schema::proposal_id_t proposal_id) const;

 private:
  void store_history(warden::schema::proposal_id_t proposal_id,
                     const std::vector<warden::schema::signer_id_t>& voters);

  warden::state::overlay& state_;
  encoder_t& encoder_;
  const signer_registry& registry_;
  const proposal_store& proposals_;
};

}  // namespace warden::governance
