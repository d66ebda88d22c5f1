#include <courier/testing/bridge_network.hpp>
#include <gtest/gtest.h>

#include <optional>

namespace {

using courier::testing::bridge_network;

courier::schema::message_id_t message_id_of(
    const courier::schema::transaction_result_t& result) {
  return courier::schema::make_hash32(result.data);
}

}  // namespace

TEST(relay_network, delivers_each_message_once) {
  auto net = bridge_network{"courier_relay_once"};
  auto user = courier::testing::make_address(1, 40);
  net.a().fund_bridge(1'000'000);

  auto sent = net.a().bridge().originate_mint(user, bridge_network::kChainB,
                                              net.b().bridge_address());
  ASSERT_EQ(sent.code, 0u);

  auto first = net.relay().deliver();
  ASSERT_EQ(first.size(), 1u);
  EXPECT_EQ(first[0].message_id, message_id_of(sent));
  EXPECT_EQ(first[0].source_chain_selector, bridge_network::kChainA);
  EXPECT_EQ(first[0].destination_selector, bridge_network::kChainB);
  EXPECT_EQ(first[0].result.code, 0u);
  EXPECT_TRUE(net.a().router().delivered(message_id_of(sent)));

  EXPECT_TRUE(net.relay().deliver().empty());
}

TEST(relay_network, send_never_delivers_inline) {
  auto net = bridge_network{"courier_relay_deferred"};
  auto holder = courier::testing::make_address(1, 40);
  auto recipient = courier::testing::make_address(2, 40);
  net.a().give_token(holder, 7);
  net.a().fund_bridge(1'000'000);

  auto sent = net.a().bridge().bridge_out(holder, 7, recipient,
                                          bridge_network::kChainB,
                                          net.b().bridge_address());
  ASSERT_EQ(sent.code, 0u) << sent.info;
  EXPECT_FALSE(net.a().router().delivered(message_id_of(sent)));
  EXPECT_FALSE(net.b().token().owner_of(7).has_value());
  EXPECT_FALSE(net.b().bridge().processed(message_id_of(sent)));

  ASSERT_EQ(net.relay().deliver().size(), 1u);
  EXPECT_EQ(net.b().token().owner_of(7), std::optional{recipient});
}

TEST(relay_network, redeliver_replays_to_destination) {
  auto net = bridge_network{"courier_relay_replay"};
  auto user = courier::testing::make_address(1, 40);
  net.a().fund_bridge(1'000'000);
  auto sent = net.a().bridge().originate_mint(user, bridge_network::kChainB,
                                              net.b().bridge_address());
  ASSERT_EQ(sent.code, 0u);
  ASSERT_EQ(net.relay().deliver().size(), 1u);

  auto replay = net.relay().redeliver(message_id_of(sent));
  ASSERT_TRUE(replay.has_value());
  EXPECT_EQ(replay->result.code,
            static_cast<uint32_t>(
                courier::schema::bridge_error_code::duplicate_token_id));

  EXPECT_FALSE(
      net.relay().redeliver(courier::testing::make_hash(200)).has_value());
}

TEST(relay_network, unknown_receiver_stays_in_outbox) {
  auto net = bridge_network{"courier_relay_unknown"};
  auto user = courier::testing::make_address(1, 40);
  net.a().fund_bridge(1'000'000);
  auto sent = net.a().bridge().originate_mint(
      user, bridge_network::kChainB, courier::testing::make_address(2, 99));
  ASSERT_EQ(sent.code, 0u);

  EXPECT_TRUE(net.relay().deliver().empty());
  EXPECT_FALSE(net.a().router().delivered(message_id_of(sent)));
}
