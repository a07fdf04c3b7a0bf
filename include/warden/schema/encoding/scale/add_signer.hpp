#pragma once
#include <warden/schema/encoding/scale/primitives.hpp>
#include <warden/schema/add_signer.hpp>

namespace warden::schema {

void encode(const add_signer<1>& o, ::scale::Encoder& encoder);
void decode(add_signer<1>& o, ::scale::Decoder& decoder);

}  // namespace warden::schema
