#pragma once

#include <warden/schema/call.hpp>
#include <warden/schema/domain_info.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/wallet_config.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace warden::testing {

inline warden::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = warden::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline warden::schema::named_signer_t make_named_signer_id(
    const uint8_t seed) {
  auto named = warden::schema::named_signer_t{};
  named[0] = seed;
  return named;
}

inline warden::schema::signer_id_t make_named_signer(const uint8_t seed) {
  return warden::schema::signer_id_t{make_named_signer_id(seed)};
}

inline warden::schema::domain_info_t make_domain(
    const warden::schema::hash32_t& chain_id,
    const warden::schema::account_id_t& wallet_address) {
  auto domain = warden::schema::domain_info_t{};
  domain.chain_id = chain_id;
  domain.wallet_address = wallet_address;
  return domain;
}

inline warden::schema::wallet_genesis_t make_genesis(
    const std::vector<warden::schema::signer_id_t>& signers,
    const uint32_t max_signers = warden::schema::kDefaultMaxSigners) {
  auto genesis = warden::schema::wallet_genesis_t{};
  genesis.domain = make_domain(make_hash(0xC0), make_hash(0xA0));
  genesis.max_signers = max_signers;
  genesis.signers = signers;
  return genesis;
}

inline warden::schema::call_t make_call(
    const warden::schema::account_id_t& target,
    warden::schema::bytes_t payload = {},
    const warden::schema::amount_t& value = 0) {
  auto call = warden::schema::call_t{};
  call.target = target;
  call.value = value;
  call.payload = std::move(payload);
  return call;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace warden::testing
