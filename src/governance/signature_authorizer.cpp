#include <spdlog/spdlog.h>
#include <warden/blake3/hash.hpp>
#include <warden/crypto/verify.hpp>
#include <warden/governance/signature_authorizer.hpp>
#include <warden/schema/key/engine_keys.hpp>

#include <algorithm>
#include <array>
#include <iterator>
#include <tuple>
#include <variant>

using namespace warden::schema;

namespace warden::governance {

namespace {

inline constexpr auto kDigestPrefix = std::array<uint8_t, 2>{0x19, 0x01};

template <std::size_t N>
std::optional<std::array<uint8_t, N>> fixed_signature(
    const bytes_view_t& signature) {
  if (signature.size() != N) {
    return std::nullopt;
  }
  auto out = std::array<uint8_t, N>{};
  std::copy(std::begin(signature), std::end(signature), std::begin(out));
  return out;
}

}  // namespace

hash32_t domain_separator(encoder_t& encoder, const domain_info_t& domain) {
  auto encoded = encoder.encode(
      std::tuple{kDomainTypeString, std::string_view{domain.protocol_name},
                 std::string_view{domain.protocol_version}, domain.chain_id,
                 domain.wallet_address});
  return warden::blake3::hash(bytes_view_t{encoded});
}

hash32_t vote_digest(encoder_t& encoder,
                     const domain_info_t& domain,
                     const proposal_id_t proposal_id,
                     const bool support,
                     const uint64_t nonce) {
  auto encoded_vote =
      encoder.encode(std::tuple{kVoteTypeString, proposal_id, support, nonce});
  auto struct_hash = warden::blake3::hash(bytes_view_t{encoded_vote});
  auto separator = domain_separator(encoder, domain);

  auto material = bytes_t{};
  material.reserve(kDigestPrefix.size() + separator.size() +
                   struct_hash.size());
  material.insert(std::end(material), std::begin(kDigestPrefix),
                  std::end(kDigestPrefix));
  material.insert(std::end(material), std::begin(separator),
                  std::end(separator));
  material.insert(std::end(material), std::begin(struct_hash),
                  std::end(struct_hash));
  return warden::blake3::hash(bytes_view_t{material});
}

signature_authorizer::signature_authorizer(
    warden::state::overlay& state,
    encoder_t& encoder,
    const signer_registry& registry,
    const validator_registry& validators)
    : state_{state},
      encoder_{encoder},
      registry_{registry},
      validators_{validators} {}

uint64_t signature_authorizer::nonce(const signer_id_t& signer) const {
  auto key = key::make_vote_nonce_key(encoder_, signer);
  return warden::state::get<uint64_t>(encoder_, state_, bytes_view_t{key})
      .value_or(0);
}

authorization_result signature_authorizer::authorize(
    const proposal_id_t proposal_id,
    const bool support,
    const signer_id_t& voter,
    const bytes_view_t& signature,
    vote_ledger& ledger,
    const timestamp_milliseconds_t now,
    event_list_t& events) {
  auto result = authorization_result{};
  if (!registry_.is_signer(voter)) {
    result.error = transaction_error_t{transaction_error_code::not_a_signer,
                                       "voter is not a signer"};
    return result;
  }
  auto config = registry_.config();
  if (!config) {
    result.error =
        transaction_error_t{transaction_error_code::wallet_not_initialized,
                            "wallet has no signing domain"};
    return result;
  }

  auto current_nonce = nonce(voter);
  auto digest =
      vote_digest(encoder_, config->domain, proposal_id, support, current_nonce);
  if (!key_matches(digest, voter, signature) &&
      !delegate_accepts(digest, voter, signature)) {
    result.error =
        transaction_error_t{transaction_error_code::invalid_vote_signature,
                            "signature does not authenticate the voter"};
    return result;
  }

  auto key = key::make_vote_nonce_key(encoder_, voter);
  warden::state::put(encoder_, state_, bytes_view_t{key},
                     uint64_t{current_nonce + 1});
  result.nonce_consumed = true;

  result.error = support ? ledger.cast_yes(proposal_id, voter, now, events)
                         : ledger.retract_yes(proposal_id, voter, events);
  return result;
}

bool signature_authorizer::key_matches(const hash32_t& digest,
                                       const signer_id_t& voter,
                                       const bytes_view_t& signature) const {
  auto matched = false;
  std::visit(
      overloaded{
          [&](const secp256k1_signer_id& value) {
            auto compact = fixed_signature<65>(signature);
            if (!compact) {
              return;
            }
            auto recovered = warden::crypto::recover_secp256k1(digest, *compact);
            matched = recovered.has_value() && *recovered == value.public_key;
          },
          [&](const ed25519_signer_id& value) {
            auto compact = fixed_signature<64>(signature);
            if (!compact) {
              return;
            }
            matched = warden::crypto::verify_ed25519(bytes_view_t{digest},
                                                     value, *compact);
          },
          [&](const named_signer_t&) { matched = false; }},
      voter);
  return matched;
}

bool signature_authorizer::delegate_accepts(
    const hash32_t& digest,
    const signer_id_t& voter,
    const bytes_view_t& signature) const {
  const auto* validator = validators_.find(voter);
  if (validator == nullptr) {
    return false;
  }
  try {
    return validator->is_valid_signature(digest, signature);
  } catch (const std::exception& e) {
    spdlog::warn("Delegated validator for {} failed: {}", to_string(voter),
                 e.what());
    return false;
  } catch (...) {
    spdlog::warn("Delegated validator for {} raised a non-standard exception",
                 to_string(voter));
    return false;
  }
}

}  // namespace warden::governance
