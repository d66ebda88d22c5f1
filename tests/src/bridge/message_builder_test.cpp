#include <courier/bridge/message_builder.hpp>
#include <courier/testing/chain_fixture.hpp>
#include <gtest/gtest.h>

namespace {

constexpr courier::schema::chain_selector_t kLocal = 101;
constexpr courier::schema::chain_selector_t kRemote = 202;

}  // namespace

TEST(message_builder, build_carries_every_field) {
  auto f = courier::testing::chain_fixture{"courier_builder_build", kLocal, 1};
  auto builder = courier::bridge::message_builder{f.router()};
  auto receiver = courier::testing::make_address(2, 1);
  auto message = builder.build(kRemote, receiver,
                               courier::schema::bytes_t{0x01, 0x02}, 77'000,
                               f.config().fee_token);
  EXPECT_EQ(message.version, 1u);
  EXPECT_EQ(message.destination_selector, kRemote);
  EXPECT_EQ(message.receiver, receiver);
  EXPECT_EQ(message.payload, (courier::schema::bytes_t{0x01, 0x02}));
  EXPECT_EQ(message.fee_token, f.config().fee_token);
  EXPECT_EQ(message.gas_limit, 77'000u);
}

TEST(message_builder, quote_follows_router_schedule) {
  auto f = courier::testing::chain_fixture{"courier_builder_quote", kLocal, 1};
  f.open_lane(kRemote, courier::chain::fee_schedule{.base_fee = 500,
                                                    .fee_per_payload_byte = 3,
                                                    .fee_per_gas_unit = 2});
  auto builder = courier::bridge::message_builder{f.router()};
  auto message = builder.build(kRemote, courier::testing::make_address(2, 1),
                               courier::schema::bytes_t(10, 0xAA), 1'000,
                               f.config().fee_token);
  auto quote = builder.quote(message);
  ASSERT_TRUE(courier::schema::succeeded(quote));
  EXPECT_EQ(courier::schema::value_of(quote).amount,
            courier::schema::amount_t{500 + 3 * 10 + 2 * 1'000});
}

TEST(message_builder, quote_is_never_cached) {
  auto f = courier::testing::chain_fixture{"courier_builder_fresh", kLocal, 1};
  f.open_lane(kRemote);
  auto builder = courier::bridge::message_builder{f.router()};
  auto message = builder.build(kRemote, courier::testing::make_address(2, 1),
                               courier::schema::bytes_t(4, 0x00), 10,
                               f.config().fee_token);
  auto first = builder.quote(message);
  f.open_lane(kRemote, courier::chain::fee_schedule{.base_fee = 9'999});
  auto second = builder.quote(message);
  ASSERT_TRUE(courier::schema::succeeded(first));
  ASSERT_TRUE(courier::schema::succeeded(second));
  EXPECT_NE(courier::schema::value_of(first).amount,
            courier::schema::value_of(second).amount);
  EXPECT_EQ(courier::schema::value_of(second).amount,
            courier::schema::amount_t{9'999});
}

TEST(message_builder, quote_reports_router_failures) {
  auto f = courier::testing::chain_fixture{"courier_builder_fail", kLocal, 1};
  auto builder = courier::bridge::message_builder{f.router()};
  auto message = builder.build(kRemote, courier::testing::make_address(2, 1),
                               courier::schema::bytes_t{0x01}, 10,
                               f.config().fee_token);

  auto unknown = builder.quote(message);
  ASSERT_FALSE(courier::schema::succeeded(unknown));
  EXPECT_EQ(courier::schema::error_of(unknown).code,
            courier::schema::bridge_error_code::unsupported_destination);

  f.open_lane(kRemote);
  f.router().set_online(false);
  auto offline = builder.quote(message);
  ASSERT_FALSE(courier::schema::succeeded(offline));
  EXPECT_EQ(courier::schema::error_of(offline).code,
            courier::schema::bridge_error_code::relay_unavailable);
}
