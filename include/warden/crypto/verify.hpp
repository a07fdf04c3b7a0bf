#pragma once

#include <warden/schema/primitives.hpp>
#include <optional>

namespace warden::crypto {

bool available();

/// Envelope signatures: ed25519 over the message, secp256k1 ECDSA over
/// sha256(message). Named signers never verify here.
bool verify_signature(const warden::schema::bytes_view_t& message,
                      const warden::schema::signer_id_t& signer,
                      const warden::schema::signature_t& signature);

bool verify_ed25519(const warden::schema::bytes_view_t& message,
                    const warden::schema::ed25519_signer_id& signer,
                    const warden::schema::ed25519_signature_t& signature);

/// Recover the compressed secp256k1 public key that produced a
/// `[r || s || v]` signature over a 32-byte digest. The digest is used as the
/// ECDSA message scalar directly. `v` may be 0..3 or 27..30.
std::optional<std::array<uint8_t, 33>> recover_secp256k1(
    const warden::schema::hash32_t& digest,
    const warden::schema::secp256k1_signature_t& signature);

}  // namespace warden::crypto
