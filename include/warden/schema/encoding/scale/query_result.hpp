#pragma once
#include <warden/schema/encoding/scale/primitives.hpp>
#include <warden/schema/query_result.hpp>

namespace warden::schema {

void encode(const query_result<1>& o, ::scale::Encoder& encoder);
void decode(query_result<1>& o, ::scale::Decoder& decoder);

}  // namespace warden::schema
