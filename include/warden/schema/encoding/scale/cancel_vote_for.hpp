#pragma once
#include <warden/schema/encoding/scale/primitives.hpp>
#include <warden/schema/cancel_vote_for.hpp>

namespace warden::schema {

void encode(const cancel_vote_for<1>& o, ::scale::Encoder& encoder);
void decode(cancel_vote_for<1>& o, ::scale::Decoder& decoder);

}  // namespace warden::schema
