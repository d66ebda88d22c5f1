#include <courier/blake3/hash.hpp>

namespace courier::blake3 {

hasher::hasher() : state_{} {
  blake3_hasher_init(&state_);
}

hasher& hasher::update(const courier::schema::bytes_view_t& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

hasher& hasher::update(const std::string_view& str) {
  return update(courier::schema::make_bytes_view(str));
}

courier::schema::hash32_t hasher::finalize() const {
  auto output = courier::schema::hash32_t{};
  static_assert(std::tuple_size_v<courier::schema::hash32_t> == BLAKE3_OUT_LEN);
  blake3_hasher_finalize(&state_, output.data(), output.size());
  return output;
}

courier::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

courier::schema::hash32_t hash(const courier::schema::bytes_view_t& bytes) {
  return hasher{}.update(bytes).finalize();
}

}  // namespace courier::blake3
