#include <warden/schema/encoding/scale/call.hpp>
#include <warden/schema/encoding/scale/primitives.hpp>

namespace warden::schema {

void encode(const call<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.target, encoder);
  encode(amount_to_bytes(o.value), encoder);
  encode(o.payload, encoder);
}

void decode(call<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.target, decoder);
  auto value = std::array<uint8_t, 32>{};
  decode(value, decoder);
  o.value = amount_from_bytes(value);
  decode(o.payload, decoder);
}

}  // namespace warden::schema
