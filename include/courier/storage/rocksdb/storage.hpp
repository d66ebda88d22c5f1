#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <courier/common/critical.hpp>
#include <courier/schema/encoding/scale/encoder.hpp>
#include <courier/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <scale/scale.hpp>
#include <string_view>
#include <tuple>

namespace courier::storage {

namespace detail {

using encoder_t = courier::schema::encoding::encoder<
    courier::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCommittedStateKey =
    std::string_view{"SYS|LEDGER|COMMITTED_STATE"};

inline courier::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const courier::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const courier::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const courier::schema::bytes_view_t& key,
           const T& value) const;

  std::optional<courier::schema::bytes_t> load(
      const courier::schema::bytes_view_t& key) const;
  std::optional<committed_state> load_committed_state() const;
  void apply(const std::vector<write_entry_t>& writes,
             const committed_state& state) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const courier::schema::bytes_view_t& prefix) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const courier::schema::bytes_view_t& key) const {
  auto value = load(key);
  if (!value.has_value()) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      courier::schema::bytes_view_t{value->data(), value->size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const courier::schema::bytes_view_t& key,
                                       const T& value) const {
  if (!database) {
    courier::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(courier::schema::bytes_view_t{encoded_value.data(),
                                                     encoded_value.size()}));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    courier::common::critical("Failed to put value into RocksDB");
  }
}

inline std::optional<courier::schema::bytes_t>
storage<rocksdb_storage_tag>::load(
    const courier::schema::bytes_view_t& key) const {
  if (!database) {
    courier::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    courier::common::critical("Failed to get value from RocksDB");
  }
  return courier::schema::bytes_t(std::begin(value), std::end(value));
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  auto raw = load(courier::schema::make_bytes_view(detail::kCommittedStateKey));
  if (!raw.has_value()) {
    return std::nullopt;
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<uint64_t, courier::schema::hash32_t>>(
          courier::schema::bytes_view_t{raw->data(), raw->size()});
  if (!decoded.has_value()) {
    courier::common::critical("failed to decode committed state");
  }
  return committed_state{.height = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value())};
}

inline void storage<rocksdb_storage_tag>::apply(
    const std::vector<write_entry_t>& writes,
    const committed_state& state) const {
  if (!database) {
    courier::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : writes) {
    auto key_slice =
        detail::to_slice(courier::schema::bytes_view_t{key.data(), key.size()});
    auto status =
        value.has_value()
            ? batch.Put(key_slice,
                        detail::to_slice(courier::schema::bytes_view_t{
                            value->data(), value->size()}))
            : batch.Delete(key_slice);
    if (!status.ok()) {
      courier::common::critical("failed staging ledger write");
    }
  }

  auto encoder = detail::encoder_t{};
  auto encoded_state = encoder.encode(std::tuple{state.height, state.state_root});
  auto state_status = batch.Put(
      detail::to_slice(
          courier::schema::make_bytes_view(detail::kCommittedStateKey)),
      detail::to_slice(courier::schema::bytes_view_t{encoded_state.data(),
                                                     encoded_state.size()}));
  if (!state_status.ok()) {
    courier::common::critical("failed staging committed state");
  }

  // A committed height must survive a crash together with its writes.
  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit ledger batch: {}", write_status.ToString());
    courier::common::critical("failed to commit ledger batch");
  }
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const courier::schema::bytes_view_t& prefix) const {
  if (!database) {
    courier::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  return entries;
}

}  // namespace courier::storage
