#pragma once
#include <warden/schema/encoding/scale/primitives.hpp>
#include <warden/schema/domain_info.hpp>

namespace warden::schema {

void encode(const domain_info<1>& o, ::scale::Encoder& encoder);
void decode(domain_info<1>& o, ::scale::Decoder& decoder);

}  // namespace warden::schema
