#pragma once
#include <warden/schema/primitives.hpp>

namespace warden::schema {

template <uint16_t Version>
struct remove_signer;

template <>
struct remove_signer<1> final {
  uint16_t version{1};
  signer_id_t signer{};
};

using remove_signer_t = remove_signer<1>;

}  // namespace warden::schema
