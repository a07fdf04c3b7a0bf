#pragma once
#include <warden/schema/encoding/scale/primitives.hpp>
#include <warden/schema/app_info.hpp>

namespace warden::schema {

void encode(const app_info<1>& o, ::scale::Encoder& encoder);
void decode(app_info<1>& o, ::scale::Decoder& decoder);

}  // namespace warden::schema
