#include <warden/schema/encoding/scale/domain_info.hpp>
#include <warden/schema/encoding/scale/wallet_config.hpp>

namespace warden::schema {

void encode(const wallet_config<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.domain, encoder);
  encode(o.max_signers, encoder);
}

void decode(wallet_config<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.domain, decoder);
  decode(o.max_signers, decoder);
}

void encode(const wallet_genesis<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.domain, encoder);
  encode(o.max_signers, encoder);
  encode(o.signers, encoder);
}

void decode(wallet_genesis<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.domain, decoder);
  decode(o.max_signers, decoder);
  decode(o.signers, decoder);
}

}  // namespace warden::schema
