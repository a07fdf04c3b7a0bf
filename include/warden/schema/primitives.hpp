#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <compare>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace warden::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using account_id_t = hash32_t;
using amount_t = boost::multiprecision::uint256_t;
using timestamp_milliseconds_t = uint64_t;
using proposal_id_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string_view& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);
bytes_t from_hex(std::string_view hex);

/// Fixed-width little-endian form of a call value (32 bytes).
std::array<uint8_t, 32> amount_to_bytes(const amount_t& amount);
amount_t amount_from_bytes(const std::array<uint8_t, 32>& bytes);

struct ed25519_signer_id final {
  std::array<uint8_t, 32> public_key;

  auto operator<=>(const ed25519_signer_id&) const = default;
};

struct secp256k1_signer_id final {
  std::array<uint8_t, 33> public_key;  // SEC1 compressed

  auto operator<=>(const secp256k1_signer_id&) const = default;
};

using named_signer_t = hash32_t;  // Key-less identity, validated by delegation
using signer_id_t =
    std::variant<ed25519_signer_id, secp256k1_signer_id, named_signer_t>;

using ed25519_signature_t = std::array<uint8_t, 64>;
using secp256k1_signature_t = std::array<uint8_t, 65>;  // [r || s || v]
using signature_t = std::variant<ed25519_signature_t, secp256k1_signature_t>;

/// True when every byte of the identity is zero.
bool is_null_signer(const signer_id_t& signer);

/// Raw identity bytes without the variant discriminator.
bytes_view_t signer_bytes(const signer_id_t& signer);

/// Render as `<scheme>:<hex>`, e.g. `secp256k1:02ab...`.
std::string to_string(const signer_id_t& signer);

/// Parse the `<scheme>:<hex>` form produced by to_string.
std::optional<signer_id_t> try_make_signer_id(std::string_view value);

}  // namespace warden::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
