#pragma once
#include <warden/schema/encoding/scale/primitives.hpp>
#include <warden/schema/execute_proposal.hpp>

namespace warden::schema {

void encode(const execute_proposal<1>& o, ::scale::Encoder& encoder);
void decode(execute_proposal<1>& o, ::scale::Decoder& decoder);

}  // namespace warden::schema
