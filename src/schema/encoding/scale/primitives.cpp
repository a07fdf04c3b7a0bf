#include <warden/schema/encoding/scale/primitives.hpp>

namespace warden::schema {

void encode(const ed25519_signer_id& o, ::scale::Encoder& encoder) {
  encode(o.public_key, encoder);
}

void decode(ed25519_signer_id& o, ::scale::Decoder& decoder) {
  decode(o.public_key, decoder);
}

void encode(const secp256k1_signer_id& o, ::scale::Encoder& encoder) {
  encode(o.public_key, encoder);
}

void decode(secp256k1_signer_id& o, ::scale::Decoder& decoder) {
  decode(o.public_key, decoder);
}

void encode(const proposal_status_t& o, ::scale::Encoder& encoder) {
  encode(static_cast<uint8_t>(o), encoder);
}

void decode(proposal_status_t& o, ::scale::Decoder& decoder) {
  auto value = uint8_t{};
  decode(value, decoder);
  o = static_cast<proposal_status_t>(value);
}

}  // namespace warden::schema
