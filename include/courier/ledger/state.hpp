#pragma once

#include <courier/schema/encoding/scale/encoder.hpp>
#include <courier/schema/primitives.hpp>
#include <courier/schema/transaction_event.hpp>
#include <courier/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace courier::ledger {

using storage_t = courier::storage::storage<courier::storage::rocksdb_storage_tag>;
using encoder_t = courier::schema::encoding::encoder<
    courier::schema::encoding::scale_encoder_tag>;

class transaction;

/// Host ledger for one chain.
///
/// Reads see committed storage overlaid with the writes of the open
/// transaction. Writes are only legal inside a transaction and reach RocksDB
/// in a single batch on commit, together with the new height and state root.
/// Dropping a transaction without committing discards every staged write,
/// which gives entry points all-or-nothing semantics.
class state final {
 public:
  explicit state(storage_t& storage);

  state(const state&) = delete;
  state& operator=(const state&) = delete;

  /// Open the write transaction for one entry point. Nested transactions are
  /// a programming error.
  transaction begin();

  bool in_transaction() const;

  std::optional<courier::schema::bytes_t> load(
      const courier::schema::bytes_view_t& key) const;
  void store(const courier::schema::bytes_view_t& key,
             courier::schema::bytes_t value);
  void erase(const courier::schema::bytes_view_t& key);
  bool contains(const courier::schema::bytes_view_t& key) const;

  template <typename T>
  std::optional<T> get(const courier::schema::bytes_view_t& key) const;

  template <typename T>
  void put(const courier::schema::bytes_view_t& key, const T& value);

  /// Committed and staged entries under prefix, staged values winning.
  std::vector<courier::storage::key_value_entry_t> list_by_prefix(
      const courier::schema::bytes_view_t& prefix) const;

  /// Append to the ledger event log; returns the event id.
  uint64_t emit(const courier::schema::transaction_event_t& event);

  /// Committed events with ids in the inclusive range.
  std::vector<courier::schema::transaction_event_t> events(
      uint64_t from_id,
      uint64_t to_id) const;

  uint64_t height() const;
  const courier::schema::hash32_t& state_root() const;

  encoder_t& encoder() const;

 private:
  friend class transaction;

  uint64_t commit();
  void rollback();
  void require_open(std::string_view operation) const;

  storage_t& storage_;
  mutable encoder_t encoder_;
  std::map<courier::schema::bytes_t, std::optional<courier::schema::bytes_t>>
      pending_;
  bool open_{false};
  courier::storage::committed_state committed_;
};

/// RAII scope of a ledger write transaction. Rolls back unless committed.
class transaction final {
 public:
  transaction(const transaction&) = delete;
  transaction& operator=(const transaction&) = delete;
  transaction(transaction&&) = delete;
  transaction& operator=(transaction&&) = delete;

  ~transaction();

  /// Persist staged writes; returns the committed height.
  uint64_t commit();

 private:
  friend class state;
  explicit transaction(state& ledger);

  state& ledger_;
  bool finished_{false};
};

template <typename T>
std::optional<T> state::get(const courier::schema::bytes_view_t& key) const {
  auto raw = load(key);
  if (!raw.has_value()) {
    return std::nullopt;
  }
  return encoder_.decode<T>(
      courier::schema::bytes_view_t{raw->data(), raw->size()});
}

template <typename T>
void state::put(const courier::schema::bytes_view_t& key, const T& value) {
  store(key, encoder_.encode(value));
}

}  // namespace courier::ledger
