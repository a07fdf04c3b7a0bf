#include <warden/schema/encoding/scale/primitives.hpp>
#include <warden/schema/encoding/scale/remove_signer.hpp>

namespace warden::schema {

void encode(const remove_signer<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.signer, encoder);
}

void decode(remove_signer<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.signer, decoder);
}

}  // namespace warden::schema
