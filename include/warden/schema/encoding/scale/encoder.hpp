#pragma once
#include <warden/common/critical.hpp>
#include <warden/schema/encoding/encoder.hpp>
#include <warden/schema/encoding/scale/app_info.hpp>
#include <warden/schema/encoding/scale/block_result.hpp>
#include <warden/schema/encoding/scale/call.hpp>
#include <warden/schema/encoding/scale/commit_result.hpp>
#include <warden/schema/encoding/scale/domain_info.hpp>
#include <warden/schema/encoding/scale/event_record.hpp>
#include <warden/schema/encoding/scale/governance_call.hpp>
#include <warden/schema/encoding/scale/primitives.hpp>
#include <warden/schema/encoding/scale/proposal_state.hpp>
#include <warden/schema/encoding/scale/query_result.hpp>
#include <warden/schema/encoding/scale/transaction.hpp>
#include <warden/schema/encoding/scale/transaction_event.hpp>
#include <warden/schema/encoding/scale/transaction_event_attribute.hpp>
#include <warden/schema/encoding/scale/transaction_result.hpp>
#include <warden/schema/encoding/scale/wallet_config.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace warden::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  warden::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, warden::schema::bytes_t& out);

  template <typename T>
  T decode(const warden::schema::bytes_view_t& bytes);

  /// Untrusted input (transactions, query keys): failure is a value.
  template <typename T>
  std::optional<T> try_decode(const warden::schema::bytes_view_t& bytes);
};

template <typename T>
warden::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    warden::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        warden::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const warden::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    warden::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const warden::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace warden::schema::encoding
