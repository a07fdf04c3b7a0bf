#pragma once
#include <warden/schema/encoding/scale/primitives.hpp>
#include <warden/schema/transaction.hpp>

namespace warden::schema {

void encode(const transaction<1>& o, ::scale::Encoder& encoder);
void decode(transaction<1>& o, ::scale::Decoder& decoder);

}  // namespace warden::schema
