#include <warden/crypto/verify.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>

#include <array>
#include <memory>
#include <optional>
#include <vector>

namespace warden::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using bn_ctx_ptr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
using ec_group_ptr = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>;
using ec_point_ptr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;

bool openssl_has_ed25519() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  return static_cast<bool>(ctx);
}

bool openssl_has_secp256k1() {
  auto group = ec_group_ptr{EC_GROUP_new_by_curve_name(NID_secp256k1),
                            EC_GROUP_free};
  return static_cast<bool>(group);
}

std::optional<uint8_t> recovery_id(const uint8_t v) {
  if (v <= 3) {
    return v;
  }
  if (v >= 27 && v <= 30) {
    return static_cast<uint8_t>(v - 27);
  }
  return std::nullopt;
}

bool verify_secp256k1(const warden::schema::bytes_view_t& message,
                      const warden::schema::secp256k1_signer_id& signer,
                      const warden::schema::secp256k1_signature_t& signature) {
  if (!recovery_id(signature[64])) {
    return false;
  }

  auto key_ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!key_ctx) {
    return false;
  }

  if (EVP_PKEY_fromdata_init(key_ctx.get()) != 1) {
    return false;
  }

  auto* group_name = const_cast<char*>("secp256k1");
  auto params =
      std::array{OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
                                                  group_name, 0),
                 OSSL_PARAM_construct_octet_string(
                     OSSL_PKEY_PARAM_PUB_KEY,
                     const_cast<unsigned char*>(signer.public_key.data()),
                     signer.public_key.size()),
                 OSSL_PARAM_construct_end()};

  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(key_ctx.get(), &raw_pkey, EVP_PKEY_PUBLIC_KEY,
                        params.data()) != 1) {
    return false;
  }
  auto pkey = evp_pkey_ptr{raw_pkey, EVP_PKEY_free};

  auto ecdsa_sig = ecdsa_sig_ptr{ECDSA_SIG_new(), ECDSA_SIG_free};
  if (!ecdsa_sig) {
    return false;
  }

  auto r = bignum_ptr{BN_bin2bn(signature.data(), 32, nullptr), BN_free};
  auto s = bignum_ptr{BN_bin2bn(signature.data() + 32, 32, nullptr), BN_free};
  if (!r || !s ||
      ECDSA_SIG_set0(ecdsa_sig.get(), r.release(), s.release()) != 1) {
    return false;
  }

  auto der_len = i2d_ECDSA_SIG(ecdsa_sig.get(), nullptr);
  if (der_len <= 0) {
    return false;
  }
  auto der = std::vector<uint8_t>(static_cast<size_t>(der_len));
  auto* der_ptr = der.data();
  i2d_ECDSA_SIG(ecdsa_sig.get(), &der_ptr);

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  auto ok = false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr,
                           pkey.get()) == 1) {
    ok = EVP_DigestVerify(ctx.get(), der.data(), der.size(), message.data(),
                          message.size()) == 1;
  }
  return ok;
}

}  // namespace

bool available() {
  static const auto available_now =
      openssl_has_ed25519() && openssl_has_secp256k1();
  return available_now;
}

bool verify_ed25519(const warden::schema::bytes_view_t& message,
                    const warden::schema::ed25519_signer_id& signer,
                    const warden::schema::ed25519_signature_t& signature) {
  auto pkey =
      evp_pkey_ptr{EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                               signer.public_key.data(),
                                               signer.public_key.size()),
                   EVP_PKEY_free};
  if (!pkey) {
    return false;
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  auto ok = false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) ==
      1) {
    ok = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
  }
  return ok;
}

std::optional<std::array<uint8_t, 33>> recover_secp256k1(
    const warden::schema::hash32_t& digest,
    const warden::schema::secp256k1_signature_t& signature) {
  auto recid = recovery_id(signature[64]);
  if (!recid) {
    return std::nullopt;
  }

  auto group = ec_group_ptr{EC_GROUP_new_by_curve_name(NID_secp256k1),
                            EC_GROUP_free};
  auto bn_ctx = bn_ctx_ptr{BN_CTX_new(), BN_CTX_free};
  if (!group || !bn_ctx) {
    return std::nullopt;
  }

  auto order = bignum_ptr{BN_new(), BN_free};
  auto field = bignum_ptr{BN_new(), BN_free};
  if (!order || !field ||
      EC_GROUP_get_order(group.get(), order.get(), bn_ctx.get()) != 1 ||
      EC_GROUP_get_curve(group.get(), field.get(), nullptr, nullptr,
                         bn_ctx.get()) != 1) {
    return std::nullopt;
  }

  auto r = bignum_ptr{BN_bin2bn(signature.data(), 32, nullptr), BN_free};
  auto s = bignum_ptr{BN_bin2bn(signature.data() + 32, 32, nullptr), BN_free};
  auto e = bignum_ptr{BN_bin2bn(digest.data(), 32, nullptr), BN_free};
  if (!r || !s || !e) {
    return std::nullopt;
  }
  if (BN_is_zero(r.get()) || BN_is_zero(s.get()) ||
      BN_cmp(r.get(), order.get()) >= 0 || BN_cmp(s.get(), order.get()) >= 0) {
    return std::nullopt;
  }

  // R.x = r + (recid / 2) * n, which must still be a field element.
  auto x = bignum_ptr{BN_dup(r.get()), BN_free};
  if (!x) {
    return std::nullopt;
  }
  if ((*recid & 2u) != 0 && BN_add(x.get(), x.get(), order.get()) != 1) {
    return std::nullopt;
  }
  if (BN_cmp(x.get(), field.get()) >= 0) {
    return std::nullopt;
  }

  auto point_r = ec_point_ptr{EC_POINT_new(group.get()), EC_POINT_free};
  if (!point_r ||
      EC_POINT_set_compressed_coordinates(group.get(), point_r.get(), x.get(),
                                          *recid & 1u, bn_ctx.get()) != 1) {
    return std::nullopt;
  }

  // Q = r^-1 (sR - eG)
  auto r_inv = bignum_ptr{BN_mod_inverse(nullptr, r.get(), order.get(),
                                         bn_ctx.get()),
                          BN_free};
  auto u1 = bignum_ptr{BN_new(), BN_free};
  auto u2 = bignum_ptr{BN_new(), BN_free};
  auto zero = bignum_ptr{BN_new(), BN_free};
  if (!r_inv || !u1 || !u2 || !zero) {
    return std::nullopt;
  }
  BN_zero(zero.get());
  if (BN_mod_sub(u1.get(), zero.get(), e.get(), order.get(), bn_ctx.get()) !=
          1 ||
      BN_mod_mul(u1.get(), u1.get(), r_inv.get(), order.get(), bn_ctx.get()) !=
          1 ||
      BN_mod_mul(u2.get(), s.get(), r_inv.get(), order.get(), bn_ctx.get()) !=
          1) {
    return std::nullopt;
  }

  auto point_q = ec_point_ptr{EC_POINT_new(group.get()), EC_POINT_free};
  if (!point_q || EC_POINT_mul(group.get(), point_q.get(), u1.get(),
                               point_r.get(), u2.get(), bn_ctx.get()) != 1) {
    return std::nullopt;
  }
  if (EC_POINT_is_at_infinity(group.get(), point_q.get()) == 1) {
    return std::nullopt;
  }

  auto out = std::array<uint8_t, 33>{};
  if (EC_POINT_point2oct(group.get(), point_q.get(),
                         POINT_CONVERSION_COMPRESSED, out.data(), out.size(),
                         bn_ctx.get()) != out.size()) {
    return std::nullopt;
  }
  return out;
}

bool verify_signature(const warden::schema::bytes_view_t& message,
                      const warden::schema::signer_id_t& signer,
                      const warden::schema::signature_t& signature) {
  auto verified = false;
  std::visit(
      overloaded{
          [&](const warden::schema::ed25519_signer_id& value) {
            if (!std::holds_alternative<warden::schema::ed25519_signature_t>(
                    signature)) {
              verified = false;
              return;
            }
            verified = verify_ed25519(
                message, value,
                std::get<warden::schema::ed25519_signature_t>(signature));
          },
          [&](const warden::schema::secp256k1_signer_id& value) {
            if (!std::holds_alternative<warden::schema::secp256k1_signature_t>(
                    signature)) {
              verified = false;
              return;
            }
            verified = verify_secp256k1(
                message, value,
                std::get<warden::schema::secp256k1_signature_t>(signature));
          },
          [&](const warden::schema::named_signer_t&) { verified = false; }},
      signer);
  return verified;
}

}  // namespace warden::crypto
