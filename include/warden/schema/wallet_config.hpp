#pragma once
#include <warden/schema/domain_info.hpp>
#include <warden/schema/primitives.hpp>
#include <vector>

namespace warden::schema {

inline constexpr uint32_t kDefaultMaxSigners = 50;

/// Persisted wallet parameters, fixed at genesis.
template <uint16_t Version>
struct wallet_config;

template <>
struct wallet_config<1> final {
  uint16_t version{1};
  domain_info_t domain{};
  uint32_t max_signers{kDefaultMaxSigners};
};

using wallet_config_t = wallet_config<1>;

/// Instancing boundary: what a fresh wallet instance starts from.
template <uint16_t Version>
struct wallet_genesis;

template <>
struct wallet_genesis<1> final {
  uint16_t version{1};
  domain_info_t domain{};
  uint32_t max_signers{kDefaultMaxSigners};
  std::vector<signer_id_t> signers;
};

using wallet_genesis_t = wallet_genesis<1>;

}  // namespace warden::schema
