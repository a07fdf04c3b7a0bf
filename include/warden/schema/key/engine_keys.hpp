#pragma once

#include <warden/schema/primitives.hpp>
#include <cstdint>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Governance workflow: canonical key prefixes and key codecs for wallet
// state, proposals, votes, call target state, and the event log.
namespace warden::schema::key {

inline constexpr std::string_view kWalletKeyPrefix{"SYS|STATE|WALLET|"};
inline constexpr std::string_view kSignersKeyPrefix{"SYS|STATE|SIGNERS|"};
inline constexpr std::string_view kSignerKeyPrefix{"SYS|STATE|SIGNER|"};
inline constexpr std::string_view kProposalSeqKeyPrefix{
    "SYS|STATE|PROPOSAL_SEQ|"};
inline constexpr std::string_view kProposalKeyPrefix{"SYS|STATE|PROPOSAL|"};
inline constexpr std::string_view kYesVotersKeyPrefix{"SYS|STATE|YES_VOTERS|"};
inline constexpr std::string_view kYesVoteKeyPrefix{"SYS|STATE|YES_VOTE|"};
inline constexpr std::string_view kVoteNonceKeyPrefix{"SYS|STATE|VOTE_NONCE|"};
inline constexpr std::string_view kSequenceKeyPrefix{"SYS|STATE|SEQUENCE|"};
inline constexpr std::string_view kEventSeqKeyPrefix{"SYS|STATE|EVENT_SEQ|"};
inline constexpr std::string_view kTargetPrefix{"SYS|TARGET|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

template <typename Encoder, typename T>
warden::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                          std::string_view prefix,
                                          const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
warden::schema::bytes_t make_wallet_config_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kWalletKeyPrefix,
                           std::string_view{"CONFIG"});
}

template <typename Encoder>
warden::schema::bytes_t make_signer_list_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kSignersKeyPrefix,
                           std::string_view{"LIST"});
}

template <typename Encoder>
warden::schema::bytes_t make_signer_key(
    Encoder& encoder,
    const warden::schema::signer_id_t& signer) {
  return make_prefixed_key(encoder, kSignerKeyPrefix, signer);
}

template <typename Encoder>
warden::schema::bytes_t make_proposal_sequence_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kProposalSeqKeyPrefix,
                           std::string_view{"NEXT"});
}

template <typename Encoder>
warden::schema::bytes_t make_proposal_key(
    Encoder& encoder,
    const warden::schema::proposal_id_t proposal_id) {
  return make_prefixed_key(encoder, kProposalKeyPrefix, proposal_id);
}

template <typename Encoder>
warden::schema::bytes_t make_yes_voters_key(
    Encoder& encoder,
    const warden::schema::proposal_id_t proposal_id) {
  return make_prefixed_key(encoder, kYesVotersKeyPrefix, proposal_id);
}

template <typename Encoder>
warden::schema::bytes_t make_yes_vote_key(
    Encoder& encoder,
    const warden::schema::proposal_id_t proposal_id,
    const warden::schema::signer_id_t& voter) {
  return make_prefixed_key(encoder, kYesVoteKeyPrefix,
                           std::tuple{proposal_id, voter});
}

template <typename Encoder>
warden::schema::bytes_t make_vote_nonce_key(
    Encoder& encoder,
    const warden::schema::signer_id_t& signer) {
  return make_prefixed_key(encoder, kVoteNonceKeyPrefix, signer);
}

template <typename Encoder>
warden::schema::bytes_t make_sequence_key(
    Encoder& encoder,
    const warden::schema::signer_id_t& signer) {
  return make_prefixed_key(encoder, kSequenceKeyPrefix, signer);
}

template <typename Encoder>
warden::schema::bytes_t make_event_sequence_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kEventSeqKeyPrefix,
                           std::string_view{"NEXT"});
}

template <typename Encoder>
warden::schema::bytes_t make_event_key(Encoder& encoder, uint64_t event_id) {
  return make_prefixed_key(encoder, kEventPrefix, event_id);
}

/// Namespace of one call target's private state.
template <typename Encoder>
warden::schema::bytes_t make_target_prefix_key(
    Encoder& encoder,
    const warden::schema::account_id_t& target) {
  return make_prefixed_key(encoder, kTargetPrefix, target);
}

}  // namespace warden::schema::key
