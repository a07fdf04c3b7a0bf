#pragma once
#include <warden/schema/encoding/scale/primitives.hpp>
#include <warden/schema/vote_on_behalf_of.hpp>

namespace warden::schema {

void encode(const vote_on_behalf_of<1>& o, ::scale::Encoder& encoder);
void decode(vote_on_behalf_of<1>& o, ::scale::Decoder& decoder);

}  // namespace warden::schema
