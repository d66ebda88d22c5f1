#include <courier/schema/encoding/scale/encoder.hpp>
#include <courier/storage/rocksdb/storage.hpp>
#include <courier/storage/storage.hpp>
#include <courier/testing/common.hpp>
#include <gtest/gtest.h>
#include <rocksdb/table.h>

#include <optional>
#include <string>
#include <vector>

namespace {

using storage_t =
    courier::storage::storage<courier::storage::rocksdb_storage_tag>;
using encoder_t = courier::schema::encoding::encoder<
    courier::schema::encoding::scale_encoder_tag>;

courier::schema::bytes_t key_of(const std::string& text) {
  return courier::schema::make_bytes(text);
}

courier::schema::bytes_view_t view(const courier::schema::bytes_t& bytes) {
  return courier::schema::bytes_view_t{bytes.data(), bytes.size()};
}

}  // namespace

TEST(storage_types, defaults_are_stable) {
  auto committed = courier::storage::committed_state{};
  EXPECT_EQ(committed.height, 0u);
  EXPECT_EQ(committed.state_root, courier::schema::make_zero_hash());

  auto entry = courier::storage::key_value_entry_t{};
  EXPECT_TRUE(entry.first.empty());
  EXPECT_TRUE(entry.second.empty());
}

TEST(storage_types, fresh_database_has_no_committed_state) {
  auto db = courier::testing::make_db_path("courier_storage_fresh");
  {
    auto storage = courier::storage::make_storage<
        courier::storage::rocksdb_storage_tag>(db);
    EXPECT_FALSE(storage.load_committed_state().has_value());
    EXPECT_FALSE(storage.load(view(key_of("missing"))).has_value());
  }
  courier::testing::remove_path(db);
}

TEST(storage_types, typed_put_and_get_round_trip) {
  auto db = courier::testing::make_db_path("courier_storage_typed");
  {
    auto storage = courier::storage::make_storage<
        courier::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto key = key_of("counter");
    storage.put(encoder, view(key), uint64_t{42});
    auto loaded = storage.get<uint64_t>(encoder, view(key));
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, 42u);
  }
  courier::testing::remove_path(db);
}

TEST(storage_types, apply_writes_batch_and_checkpoint_together) {
  auto db = courier::testing::make_db_path("courier_storage_apply");
  {
    auto storage = courier::storage::make_storage<
        courier::storage::rocksdb_storage_tag>(db);
    storage.apply({{key_of("a"), courier::schema::bytes_t{0x01}},
                   {key_of("b"), courier::schema::bytes_t{0x02}}},
                  courier::storage::committed_state{
                      .height = 1, .state_root = courier::testing::make_hash(1)});

    storage.apply({{key_of("a"), std::nullopt},
                   {key_of("c"), courier::schema::bytes_t{0x03}}},
                  courier::storage::committed_state{
                      .height = 2, .state_root = courier::testing::make_hash(2)});

    EXPECT_FALSE(storage.load(view(key_of("a"))).has_value());
    EXPECT_EQ(storage.load(view(key_of("b"))),
              std::optional{courier::schema::bytes_t{0x02}});
    EXPECT_EQ(storage.load(view(key_of("c"))),
              std::optional{courier::schema::bytes_t{0x03}});

    auto committed = storage.load_committed_state();
    ASSERT_TRUE(committed.has_value());
    EXPECT_EQ(committed->height, 2u);
    EXPECT_EQ(committed->state_root, courier::testing::make_hash(2));
  }
  courier::testing::remove_path(db);
}

TEST(storage_types, committed_state_survives_reopen) {
  auto db = courier::testing::make_db_path("courier_storage_reopen");
  {
    auto storage = courier::storage::make_storage<
        courier::storage::rocksdb_storage_tag>(db);
    storage.apply({{key_of("k"), courier::schema::bytes_t{0x09}}},
                  courier::storage::committed_state{
                      .height = 7, .state_root = courier::testing::make_hash(7)});
  }
  {
    auto storage = courier::storage::make_storage<
        courier::storage::rocksdb_storage_tag>(db);
    auto committed = storage.load_committed_state();
    ASSERT_TRUE(committed.has_value());
    EXPECT_EQ(committed->height, 7u);
    EXPECT_TRUE(storage.load(view(key_of("k"))).has_value());
  }
  courier::testing::remove_path(db);
}

TEST(storage_types, list_by_prefix_stops_at_prefix_boundary) {
  auto db = courier::testing::make_db_path("courier_storage_prefix");
  {
    auto storage = courier::storage::make_storage<
        courier::storage::rocksdb_storage_tag>(db);
    storage.apply({{key_of("item|1"), courier::schema::bytes_t{0x01}},
                   {key_of("item|2"), courier::schema::bytes_t{0x02}},
                   {key_of("items"), courier::schema::bytes_t{0x03}},
                   {key_of("other"), courier::schema::bytes_t{0x04}}},
                  courier::storage::committed_state{.height = 1});

    auto entries = storage.list_by_prefix(view(key_of("item|")));
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].first, key_of("item|1"));
    EXPECT_EQ(entries[1].second, courier::schema::bytes_t{0x02});
  }
  courier::testing::remove_path(db);
}

TEST(storage_types, ledger_store_opens_with_bloom_filtered_tables) {
  auto db = courier::testing::make_db_path("courier_storage_options");
  {
    auto storage = courier::storage::make_storage<
        courier::storage::rocksdb_storage_tag>(db);
    auto options = storage.database->GetOptions();
    EXPECT_TRUE(options.paranoid_checks);
    EXPECT_TRUE(options.create_if_missing);
    const auto* table = options.table_factory
                            ->GetOptions<ROCKSDB_NAMESPACE::BlockBasedTableOptions>();
    ASSERT_NE(table, nullptr);
    EXPECT_NE(table->filter_policy, nullptr);
    EXPECT_TRUE(table->whole_key_filtering);
  }
  courier::testing::remove_path(db);
}
