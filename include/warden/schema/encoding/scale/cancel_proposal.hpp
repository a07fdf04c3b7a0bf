#pragma once
#include <warden/schema/encoding/scale/primitives.hpp>
#include <warden/schema/cancel_proposal.hpp>

namespace warden::schema {

void encode(const cancel_proposal<1>& o, ::scale::Encoder& encoder);
void decode(cancel_proposal<1>& o, ::scale::Decoder& decoder);

}  // namespace warden::schema
