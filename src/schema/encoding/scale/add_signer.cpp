#include <warden/schema/encoding/scale/add_signer.hpp>
#include <warden/schema/encoding/scale/primitives.hpp>

namespace warden::schema {

void encode(const add_signer<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.signer, encoder);
}

void decode(add_signer<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.signer, decoder);
}

}  // namespace warden::schema
