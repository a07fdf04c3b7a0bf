#include <warden/schema/encoding/scale/domain_info.hpp>

namespace warden::schema {

void encode(const domain_info<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.protocol_name, encoder);
  encode(o.protocol_version, encoder);
  encode(o.chain_id, encoder);
  encode(o.wallet_address, encoder);
}

void decode(domain_info<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.protocol_name, decoder);
  decode(o.protocol_version, decoder);
  decode(o.chain_id, decoder);
  decode(o.wallet_address, decoder);
}

}  // namespace warden::schema
