#pragma once
#include <warden/schema/encoding/scale/primitives.hpp>
#include <warden/schema/remove_signer.hpp>

namespace warden::schema {

void encode(const remove_signer<1>& o, ::scale::Encoder& encoder);
void decode(remove_signer<1>& o, ::scale::Decoder& decoder);

}  // namespace warden::schema
