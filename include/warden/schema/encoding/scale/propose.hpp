#pragma once
#include <warden/schema/encoding/scale/primitives.hpp>
#include <warden/schema/propose.hpp>

namespace warden::schema {

void encode(const propose<1>& o, ::scale::Encoder& encoder);
void decode(propose<1>& o, ::scale::Decoder& decoder);

}  // namespace warden::schema
