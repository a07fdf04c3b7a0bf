#pragma once
#include <warden/schema/encoding/scale/primitives.hpp>
#include <warden/schema/block_result.hpp>

namespace warden::schema {

void encode(const block_result<1>& o, ::scale::Encoder& encoder);
void decode(block_result<1>& o, ::scale::Decoder& decoder);

}  // namespace warden::schema
