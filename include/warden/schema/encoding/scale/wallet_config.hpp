#pragma once
#include <warden/schema/encoding/scale/primitives.hpp>
#include <warden/schema/wallet_config.hpp>

namespace warden::schema {

void encode(const wallet_config<1>& o, ::scale::Encoder& encoder);
void decode(wallet_config<1>& o, ::scale::Decoder& decoder);

void encode(const wallet_genesis<1>& o, ::scale::Encoder& encoder);
void decode(wallet_genesis<1>& o, ::scale::Decoder& decoder);

}  // namespace warden::schema
