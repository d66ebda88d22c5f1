#pragma once
#include <courier/common/critical.hpp>
#include <courier/schema/encoding/encoder.hpp>
#include <courier/schema/encoding/scale/inbound_message.hpp>
#include <courier/schema/encoding/scale/message_receipt.hpp>
#include <courier/schema/encoding/scale/outbound_message.hpp>
#include <courier/schema/encoding/scale/routed_message.hpp>
#include <courier/schema/encoding/scale/transaction_event.hpp>
#include <courier/schema/encoding/scale/transaction_event_attribute.hpp>
#include <courier/schema/encoding/scale/transfer_intent.hpp>
#include <exception>
#include <iterator>
#include <scale/scale.hpp>

namespace courier::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  courier::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, courier::schema::bytes_t& out);

  template <typename T>
  T decode(const courier::schema::bytes_view_t& bytes);

  /// Non-aborting decode for untrusted bytes (relay payloads, query
  /// arguments). Any codec failure, including a thrown decode error on
  /// truncated input, yields std::nullopt.
  template <typename T>
  std::optional<T> try_decode(const courier::schema::bytes_view_t& bytes);
};

template <typename T>
courier::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    courier::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        courier::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const courier::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    courier::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const courier::schema::bytes_view_t& bytes) {
  try {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      return std::nullopt;
    }
    return decoded.value();
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

}  // namespace courier::schema::encoding
