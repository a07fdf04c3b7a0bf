#pragma once
#include <warden/schema/encoding/scale/primitives.hpp>
#include <warden/schema/call.hpp>

namespace warden::schema {

void encode(const call<1>& o, ::scale::Encoder& encoder);
void decode(call<1>& o, ::scale::Decoder& decoder);

}  // namespace warden::schema
