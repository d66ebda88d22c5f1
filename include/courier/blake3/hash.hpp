#pragma once
#include <blake3.h>
#include <courier/schema/primitives.hpp>
#include <string_view>

namespace courier::blake3 {

/// Incremental BLAKE3 over several byte ranges. Feeding chunks in order
/// yields the same digest as hashing their concatenation.
class hasher final {
 public:
  hasher();

  hasher& update(const courier::schema::bytes_view_t& bytes);
  hasher& update(const std::string_view& str);

  /// Does not reset the hasher; further updates extend the same input.
  courier::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_;
};

courier::schema::hash32_t hash(const std::string_view& str);
courier::schema::hash32_t hash(const courier::schema::bytes_view_t& bytes);

}  // namespace courier::blake3
