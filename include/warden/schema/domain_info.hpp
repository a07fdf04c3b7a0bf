#pragma once
#include <warden/schema/primitives.hpp>
#include <string>

// Schema type: domain info.
// Governance workflow: the four fields bound into every signed vote digest so
// a signature cannot cross protocol versions, networks or wallet instances.
namespace warden::schema {

template <uint16_t Version>
struct domain_info;

template <>
struct domain_info<1> final {
  uint16_t version{1};
  std::string protocol_name{"warden"};
  std::string protocol_version{"1"};
  hash32_t chain_id{};
  account_id_t wallet_address{};
};

using domain_info_t = domain_info<1>;

}  // namespace warden::schema
