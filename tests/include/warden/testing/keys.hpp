#pragma once

#include <warden/crypto/verify.hpp>
#include <warden/schema/primitives.hpp>

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>

#include <array>
#include <memory>
#include <stdexcept>
#include <vector>

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#endif

namespace warden::testing {

/// Throwaway secp256k1 key producing recoverable `[r || s || v]` signatures.
class secp256k1_key final {
 public:
  secp256k1_key() : key_{EC_KEY_new_by_curve_name(NID_secp256k1), EC_KEY_free} {
    if (!key_ || EC_KEY_generate_key(key_.get()) != 1) {
      throw std::runtime_error{"secp256k1 key generation failed"};
    }
    EC_KEY_set_conv_form(key_.get(), POINT_CONVERSION_COMPRESSED);
    auto* out = public_key_.data();
    if (i2o_ECPublicKey(key_.get(), &out) !=
        static_cast<int>(public_key_.size())) {
      throw std::runtime_error{"secp256k1 public key export failed"};
    }
  }

  warden::schema::signer_id_t signer() const {
    return warden::schema::signer_id_t{
        warden::schema::secp256k1_signer_id{.public_key = public_key_}};
  }

  /// Sign the digest as the raw ECDSA message scalar.
  warden::schema::secp256k1_signature_t sign_digest(
      const warden::schema::hash32_t& digest) const {
    auto sig = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>{
        ECDSA_do_sign(digest.data(), static_cast<int>(digest.size()),
                      key_.get()),
        ECDSA_SIG_free};
    if (!sig) {
      throw std::runtime_error{"ECDSA_do_sign failed"};
    }
    auto out = warden::schema::secp256k1_signature_t{};
    const BIGNUM* r = nullptr;
    const BIGNUM* s = nullptr;
    ECDSA_SIG_get0(sig.get(), &r, &s);
    BN_bn2binpad(r, out.data(), 32);
    BN_bn2binpad(s, out.data() + 32, 32);
    for (uint8_t v = 0; v < 4; ++v) {
      out[64] = v;
      auto recovered = warden::crypto::recover_secp256k1(digest, out);
      if (recovered && *recovered == public_key_) {
        return out;
      }
    }
    throw std::runtime_error{"no recovery id reproduces the public key"};
  }

  /// Envelope form: ECDSA over sha256(message).
  warden::schema::secp256k1_signature_t sign_message(
      const warden::schema::bytes_view_t& message) const {
    auto digest = warden::schema::hash32_t{};
    auto size = static_cast<unsigned int>(digest.size());
    if (EVP_Digest(message.data(), message.size(), digest.data(), &size,
                   EVP_sha256(), nullptr) != 1) {
      throw std::runtime_error{"sha256 failed"};
    }
    return sign_digest(digest);
  }

  warden::schema::bytes_t sign_digest_bytes(
      const warden::schema::hash32_t& digest) const {
    auto signature = sign_digest(digest);
    return warden::schema::bytes_t{std::begin(signature), std::end(signature)};
  }

 private:
  std::unique_ptr<EC_KEY, decltype(&EC_KEY_free)> key_;
  std::array<uint8_t, 33> public_key_{};
};

class ed25519_key final {
 public:
  ed25519_key() : key_{nullptr, EVP_PKEY_free} {
    auto ctx = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>{
        EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), EVP_PKEY_CTX_free};
    auto* raw = static_cast<EVP_PKEY*>(nullptr);
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1 ||
        EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
      throw std::runtime_error{"ed25519 key generation failed"};
    }
    key_.reset(raw);
    auto size = public_key_.size();
    if (EVP_PKEY_get_raw_public_key(key_.get(), public_key_.data(), &size) !=
        1) {
      throw std::runtime_error{"ed25519 public key export failed"};
    }
  }

  warden::schema::ed25519_signer_id id() const {
    return warden::schema::ed25519_signer_id{.public_key = public_key_};
  }

  warden::schema::signer_id_t signer() const {
    return warden::schema::signer_id_t{id()};
  }

  warden::schema::ed25519_signature_t sign(
      const warden::schema::bytes_view_t& message) const {
    auto ctx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>{
        EVP_MD_CTX_new(), EVP_MD_CTX_free};
    auto out = warden::schema::ed25519_signature_t{};
    auto size = out.size();
    if (!ctx ||
        EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) !=
            1 ||
        EVP_DigestSign(ctx.get(), out.data(), &size, message.data(),
                       message.size()) != 1) {
      throw std::runtime_error{"ed25519 signing failed"};
    }
    return out;
  }

  warden::schema::bytes_t sign_bytes(
      const warden::schema::bytes_view_t& message) const {
    auto signature = sign(message);
    return warden::schema::bytes_t{std::begin(signature), std::end(signature)};
  }

 private:
  std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key_;
  std::array<uint8_t, 32> public_key_{};
};

}  // namespace warden::testing

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif
