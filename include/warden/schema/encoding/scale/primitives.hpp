#pragma once
#include <warden/schema/primitives.hpp>
#include <warden/schema/proposal_status.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace warden::schema {

// Library overloads for builtin and standard types.
using ::scale::decode;
using ::scale::encode;

void encode(const ed25519_signer_id& o, ::scale::Encoder& encoder);
void decode(ed25519_signer_id& o, ::scale::Decoder& decoder);

void encode(const secp256k1_signer_id& o, ::scale::Encoder& encoder);
void decode(secp256k1_signer_id& o, ::scale::Decoder& decoder);

void encode(const proposal_status_t& o, ::scale::Encoder& encoder);
void decode(proposal_status_t& o, ::scale::Decoder& decoder);

}  // namespace warden::schema
