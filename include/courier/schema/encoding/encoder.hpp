#pragma once
#include <courier/schema/primitives.hpp>
#include <optional>
#include <span>

namespace courier::schema::encoding {

// Encoders are selected at build time through a library tag, e.g.
// encoder<scale_encoder_tag>. Hot swapping is not a goal; every persisted
// record and every cross-chain payload goes through the same tag so both
// chains agree on the byte layout.
template <typename Library>
struct encoder {
  template <typename T>
  courier::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, courier::schema::bytes_t& out);

  template <typename T>
  T decode(const courier::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const courier::schema::bytes_view_t& bytes);
};

}  // namespace courier::schema::encoding
