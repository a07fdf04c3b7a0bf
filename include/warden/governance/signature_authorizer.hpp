#pragma once
#include <warden/governance/signature_validator.hpp>
#include <warden/governance/signer_registry.hpp>
#include <warden/governance/types.hpp>
#include <warden/governance/vote_ledger.hpp>
#include <warden/schema/domain_info.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/transaction_error_code.hpp>
#include <warden/state/overlay.hpp>
#include <optional>
#include <string_view>

namespace warden::governance {

inline constexpr auto kDomainTypeString = std::string_view{
    "WardenDomain(string name,string version,bytes32 chainId,bytes32 "
    "walletAddress)"};
inline constexpr auto kVoteTypeString =
    std::string_view{"Vote(uint64 proposalId,bool support,uint64 nonce)"};

/// blake3 over the SCALE encoding of the domain type string and its four
/// fields.
warden::schema::hash32_t domain_separator(
    encoder_t& encoder,
    const warden::schema::domain_info_t& domain);

/// blake3(0x19 0x01 || domain_separator || blake3(vote struct)).
warden::schema::hash32_t vote_digest(
    encoder_t& encoder,
    const warden::schema::domain_info_t& domain,
    warden::schema::proposal_id_t proposal_id,
    bool support,
    uint64_t nonce);

struct authorization_result final {
  std::optional<warden::schema::transaction_error_t> error;
  /// Set once the signature has been accepted. The nonce write must then be
  /// kept even if the ledger rejected the vote.
  bool nonce_consumed{false};
};

/// Authenticates votes submitted on a signer's behalf.
///
/// A signature is accepted when the key recovered from (or verified against)
/// the vote digest is the voter's, or when the voter's delegated validator
/// approves it. Each acceptance consumes the voter's current nonce, which is
/// bound into the digest, so a signature authenticates at most once.
class signature_authorizer final {
 public:
  signature_authorizer(warden::state::overlay& state,
                       encoder_t& encoder,
                       const signer_registry& registry,
                       const validator_registry& validators);

  uint64_t nonce(const warden::schema::signer_id_t& signer) const;

  authorization_result authorize(
      warden::schema::proposal_id_t proposal_id,
      bool support,
      const warden::schema::signer_id_t& voter,
      const warden::schema::bytes_view_t& signature,
      vote_ledger& ledger,
      warden::schema::timestamp_milliseconds_t now,
      event_list_t& events);

 private:
  bool key_matches(const warden::schema::hash32_t& digest,
                   const warden::schema::signer_id_t& voter,
                   const warden::schema::bytes_view_t& signature) const;
  bool delegate_accepts(const warden::schema::hash32_t& digest,
                        const warden::schema::signer_id_t& voter,
                        const warden::schema::bytes_view_t& signature) const;

  warden::state::overlay& state_;
  encoder_t& encoder_;
  const signer_registry& registry_;
  const validator_registry& validators_;
};

}  // namespace warden::governance
