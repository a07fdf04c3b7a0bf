#pragma once
#include <warden/schema/encoding/scale/primitives.hpp>
#include <warden/schema/event_record.hpp>

namespace warden::schema {

void encode(const event_record<1>& o, ::scale::Encoder& encoder);
void decode(event_record<1>& o, ::scale::Decoder& decoder);

}  // namespace warden::schema
