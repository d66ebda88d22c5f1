#pragma once
#include <courier/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace courier::storage {

using key_value_entry_t =
    std::pair<courier::schema::bytes_t, courier::schema::bytes_t>;

/// One staged mutation; an empty value deletes the key.
using write_entry_t = std::pair<courier::schema::bytes_t,
                                std::optional<courier::schema::bytes_t>>;

/// Last committed ledger checkpoint persisted by the storage backend.
struct committed_state final {
  uint64_t height{};
  courier::schema::hash32_t state_root{};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const courier::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const courier::schema::bytes_view_t& key,
           const T& value) const;

  /// Return raw bytes at key, or std::nullopt when missing.
  std::optional<courier::schema::bytes_t> load(
      const courier::schema::bytes_view_t& key) const;

  /// Load the most recent committed checkpoint (height + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Atomically apply staged writes together with the new checkpoint.
  void apply(const std::vector<write_entry_t>& writes,
             const committed_state& state) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const courier::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace courier::storage
