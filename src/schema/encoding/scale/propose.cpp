#include <warden/schema/encoding/scale/call.hpp>
#include <warden/schema/encoding/scale/propose.hpp>

namespace warden::schema {

void encode(const propose<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.calls, encoder);
  encode(o.expires_at, encoder);
}

void decode(propose<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.calls, decoder);
  decode(o.expires_at, decoder);
}

}  // namespace warden::schema
