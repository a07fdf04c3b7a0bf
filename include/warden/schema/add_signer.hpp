#pragma once
#include <warden/schema/primitives.hpp>

namespace warden::schema {

template <uint16_t Version>
struct add_signer;

template <>
struct add_signer<1> final {
  uint16_t version{1};
  signer_id_t signer{};
};

using add_signer_t = add_signer<1>;

}  // namespace warden::schema
