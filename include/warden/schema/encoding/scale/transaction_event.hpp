#pragma once
#include <warden/schema/encoding/scale/primitives.hpp>
#include <warden/schema/transaction_event.hpp>

namespace warden::schema {

void encode(const transaction_event<1>& o, ::scale::Encoder& encoder);
void decode(transaction_event<1>& o, ::scale::Decoder& decoder);

}  // namespace warden::schema
