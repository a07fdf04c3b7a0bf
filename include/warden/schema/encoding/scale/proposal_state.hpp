#pragma once
#include <warden/schema/encoding/scale/primitives.hpp>
#include <warden/schema/proposal_state.hpp>

namespace warden::schema {

void encode(const proposal_state<1>& o, ::scale::Encoder& encoder);
void decode(proposal_state<1>& o, ::scale::Decoder& decoder);

}  // namespace warden::schema
