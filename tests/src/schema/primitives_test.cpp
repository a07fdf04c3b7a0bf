#include <gtest/gtest.h>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/testing/common.hpp>

#include <limits>

namespace {

using encoder_t = warden::schema::encoding::encoder<
    warden::schema::encoding::scale_encoder_tag>;

}  // namespace

TEST(primitives, make_hash32_from_bytes_round_trips) {
  auto input = warden::schema::bytes_t(32, 0xAB);
  auto hash = warden::schema::make_hash32(input);
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = warden::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
}

TEST(primitives, try_from_hex_rejects_odd_and_non_hex_input) {
  EXPECT_FALSE(warden::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(warden::schema::try_from_hex("zz").has_value());
  EXPECT_EQ(warden::schema::to_hex(warden::schema::bytes_view_t{
                *warden::schema::try_from_hex("0xBEEF")}),
            "beef");
}

TEST(primitives, amount_bytes_are_little_endian) {
  auto amount = warden::schema::amount_t{0x0102};
  auto bytes = warden::schema::amount_to_bytes(amount);
  EXPECT_EQ(bytes[0], 0x02);
  EXPECT_EQ(bytes[1], 0x01);
  EXPECT_EQ(bytes[31], 0x00);

  auto max = std::numeric_limits<warden::schema::amount_t>::max();
  EXPECT_EQ(warden::schema::amount_from_bytes(
                warden::schema::amount_to_bytes(max)),
            max);
}

TEST(primitives, null_signer_is_all_zero_bytes) {
  EXPECT_TRUE(warden::schema::is_null_signer(
      warden::schema::signer_id_t{warden::schema::named_signer_t{}}));
  EXPECT_TRUE(warden::schema::is_null_signer(warden::schema::signer_id_t{
      warden::schema::secp256k1_signer_id{}}));
  EXPECT_FALSE(
      warden::schema::is_null_signer(warden::testing::make_named_signer(1)));
}

TEST(primitives, signer_text_form_round_trips) {
  auto signer = warden::testing::make_named_signer(7);
  auto text = warden::schema::to_string(signer);
  EXPECT_EQ(text.substr(0, 6), "named:");
  auto parsed = warden::schema::try_make_signer_id(text);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, signer);
}

TEST(primitives, signer_text_form_rejects_bad_input) {
  EXPECT_FALSE(warden::schema::try_make_signer_id("ed25519").has_value());
  EXPECT_FALSE(warden::schema::try_make_signer_id("rsa:00").has_value());
  EXPECT_FALSE(warden::schema::try_make_signer_id("ed25519:0011").has_value());
  // Compressed secp256k1 keys start with 0x02 or 0x03.
  auto uncompressed_prefix = std::string{"secp256k1:04"} + std::string(64, '1');
  EXPECT_FALSE(
      warden::schema::try_make_signer_id(uncompressed_prefix).has_value());
}

TEST(primitives, signer_encoding_distinguishes_schemes) {
  auto encoder = encoder_t{};
  auto named = warden::testing::make_named_signer(3);
  auto ed = warden::schema::signer_id_t{warden::schema::ed25519_signer_id{
      .public_key = warden::schema::named_signer_t{3}}};
  EXPECT_NE(encoder.encode(named), encoder.encode(ed));
  EXPECT_EQ(encoder.decode<warden::schema::signer_id_t>(
                warden::schema::bytes_view_t{encoder.encode(ed)}),
            ed);
}

TEST(primitives, truncated_transaction_fails_to_decode) {
  auto encoder = encoder_t{};
  auto tx = warden::schema::transaction_t{};
  tx.signer = warden::testing::make_named_signer(1);
  tx.payload = warden::schema::vote_for_t{.proposal_id = 4};
  tx.signature = warden::schema::ed25519_signature_t{};
  auto encoded = encoder.encode(tx);
  encoded.resize(encoded.size() / 2);
  EXPECT_FALSE(encoder.try_decode<warden::schema::transaction_t>(
                          warden::schema::bytes_view_t{encoded})
                   .has_value());
}
