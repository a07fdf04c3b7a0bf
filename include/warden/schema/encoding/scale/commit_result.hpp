#pragma once
#include <warden/schema/encoding/scale/primitives.hpp>
#include <warden/schema/commit_result.hpp>

namespace warden::schema {

void encode(const commit_result<1>& o, ::scale::Encoder& encoder);
void decode(commit_result<1>& o, ::scale::Decoder& decoder);

}  // namespace warden::schema
