#include <warden/common/critical.hpp>
#include <warden/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <string_view>

namespace warden::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

template <std::size_t N>
std::optional<std::array<uint8_t, N>> try_make_array(std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != N) {
    return std::nullopt;
  }
  auto out = std::array<uint8_t, N>{};
  std::copy(std::begin(*decoded), std::end(*decoded), std::begin(out));
  return out;
}

inline constexpr auto kEd25519Scheme = std::string_view{"ed25519"};
inline constexpr auto kSecp256k1Scheme = std::string_view{"secp256k1"};
inline constexpr auto kNamedScheme = std::string_view{"named"};

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

hash32_t make_hash32(const bytes_t& bytes) {
  if (bytes.size() != 32) {
    warden::common::critical("make_hash32 expected exactly 32 bytes");
  }
  auto hash = hash32_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(hash));
  return hash;
}

hash32_t make_hash32(const std::string_view& bytes) {
  auto hash = try_make_hash32(bytes);
  if (!hash.has_value()) {
    warden::common::critical("make_hash32 expected 64 hex characters");
  }
  return *hash;
}

std::optional<hash32_t> try_make_hash32(const std::string_view& bytes) {
  return try_make_array<32>(bytes);
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

bytes_t from_hex(const std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded.has_value()) {
    warden::common::critical("invalid hex input");
  }
  return *decoded;
}

std::array<uint8_t, 32> amount_to_bytes(const amount_t& amount) {
  auto digits = bytes_t{};
  boost::multiprecision::export_bits(amount, std::back_inserter(digits), 8,
                                     false);
  auto out = std::array<uint8_t, 32>{};
  std::copy_n(std::begin(digits), std::min(digits.size(), out.size()),
              std::begin(out));
  return out;
}

amount_t amount_from_bytes(const std::array<uint8_t, 32>& bytes) {
  auto amount = amount_t{};
  boost::multiprecision::import_bits(amount, std::begin(bytes),
                                     std::end(bytes), 8, false);
  return amount;
}

bool is_null_signer(const signer_id_t& signer) {
  auto bytes = signer_bytes(signer);
  return std::ranges::all_of(bytes, [](const uint8_t b) { return b == 0; });
}

bytes_view_t signer_bytes(const signer_id_t& signer) {
  auto out = bytes_view_t{};
  std::visit(overloaded{[&](const ed25519_signer_id& value) {
                          out = bytes_view_t{value.public_key};
                        },
                        [&](const secp256k1_signer_id& value) {
                          out = bytes_view_t{value.public_key};
                        },
                        [&](const named_signer_t& value) {
                          out = bytes_view_t{value};
                        }},
             signer);
  return out;
}

std::string to_string(const signer_id_t& signer) {
  auto scheme = std::visit(
      overloaded{
          [](const ed25519_signer_id&) { return kEd25519Scheme; },
          [](const secp256k1_signer_id&) { return kSecp256k1Scheme; },
          [](const named_signer_t&) { return kNamedScheme; }},
      signer);
  auto out = std::string{scheme};
  out.push_back(':');
  out.append(to_hex(signer_bytes(signer)));
  return out;
}

std::optional<signer_id_t> try_make_signer_id(const std::string_view value) {
  auto separator = value.find(':');
  if (separator == std::string_view::npos) {
    return std::nullopt;
  }
  auto scheme = value.substr(0, separator);
  auto hex = value.substr(separator + 1);

  if (scheme == kEd25519Scheme) {
    auto key = try_make_array<32>(hex);
    if (!key) {
      return std::nullopt;
    }
    return signer_id_t{ed25519_signer_id{.public_key = *key}};
  }
  if (scheme == kSecp256k1Scheme) {
    auto key = try_make_array<33>(hex);
    if (!key || ((*key)[0] != 0x02 && (*key)[0] != 0x03)) {
      return std::nullopt;
    }
    return signer_id_t{secp256k1_signer_id{.public_key = *key}};
  }
  if (scheme == kNamedScheme) {
    auto named = try_make_array<32>(hex);
    if (!named) {
      return std::nullopt;
    }
    return signer_id_t{*named};
  }
  return std::nullopt;
}

}  // namespace warden::schema
