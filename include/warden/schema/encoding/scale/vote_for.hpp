#pragma once
#include <warden/schema/encoding/scale/primitives.hpp>
#include <warden/schema/vote_for.hpp>

namespace warden::schema {

void encode(const vote_for<1>& o, ::scale::Encoder& encoder);
void decode(vote_for<1>& o, ::scale::Decoder& decoder);

}  // namespace warden::schema
