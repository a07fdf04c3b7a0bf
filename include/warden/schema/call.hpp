#pragma once
#include <warden/schema/primitives.hpp>

// Schema type: call.
// Governance workflow: one batched operation of a proposal. The value is
// opaque to the wallet and handed to the target untouched.
namespace warden::schema {

template <uint16_t Version>
struct call;

template <>
struct call<1> final {
  uint16_t version{1};
  account_id_t target{};
  amount_t value{};
  bytes_t payload;
};

using call_t = call<1>;

}  // namespace warden::schema
