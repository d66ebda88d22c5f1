#include <courier/bridge/events.hpp>
#include <courier/bridge/inbound_receiver.hpp>
#include <courier/bridge/payload_codec.hpp>
#include <courier/testing/chain_fixture.hpp>
#include <gtest/gtest.h>

#include <vector>

namespace {

constexpr courier::schema::chain_selector_t kLocal = 101;
constexpr courier::schema::chain_selector_t kRemote = 202;

struct receive_scope final {
  explicit receive_scope(courier::testing::chain_fixture& f)
      : receiver{f.ledger(),
                 codec,
                 f.token(),
                 f.bridge_address(),
                 f.router().address(),
                 [this](const courier::schema::transaction_event_t& event) {
                   events.push_back(event);
                 }} {}

  courier::bridge::payload_codec codec;
  courier::bridge::inbound_receiver receiver;
  std::vector<courier::schema::transaction_event_t> events;
};

courier::schema::inbound_message_t make_inbound(
    const courier::bridge::payload_codec& codec,
    const uint8_t id_seed,
    const courier::schema::transfer_intent_t& intent) {
  return courier::schema::inbound_message_t{
      .message_id = courier::testing::make_hash(id_seed),
      .source_chain_selector = kRemote,
      .source_sender = courier::testing::make_address(2, 1),
      .payload = codec.encode(intent)};
}

courier::schema::transfer_intent_t make_intent(
    const courier::schema::token_id_t& token_id) {
  return courier::schema::transfer_intent_t{
      .token_id = token_id, .new_owner = courier::testing::make_address(1, 40)};
}

}  // namespace

TEST(inbound_receiver, mints_to_new_owner_and_marks_processed) {
  auto f = courier::testing::chain_fixture{"courier_inbound_ok", kLocal, 1};
  auto scope = receive_scope{f};
  auto inbound = make_inbound(scope.codec, 1, make_intent(77));

  auto tx = f.ledger().begin();
  auto intent = scope.receiver.receive(f.router().address(), inbound);
  ASSERT_TRUE(courier::schema::succeeded(intent));
  tx.commit();

  EXPECT_EQ(f.token().owner_of(77),
            std::optional{courier::testing::make_address(1, 40)});
  EXPECT_TRUE(scope.receiver.processed(inbound.message_id));
  ASSERT_EQ(scope.events.size(), 1u);
  EXPECT_EQ(scope.events[0].type, courier::bridge::kMessageReceivedEvent);
  EXPECT_EQ(courier::bridge::find_attribute(scope.events[0], "token_id"), "77");
  EXPECT_EQ(
      courier::bridge::find_attribute(scope.events[0], "source_chain_selector"),
      "202");
}

TEST(inbound_receiver, rejects_caller_other_than_router) {
  auto f = courier::testing::chain_fixture{"courier_inbound_sender", kLocal, 1};
  auto scope = receive_scope{f};
  auto inbound = make_inbound(scope.codec, 1, make_intent(77));

  auto tx = f.ledger().begin();
  auto intent =
      scope.receiver.receive(courier::testing::make_address(9, 9), inbound);
  ASSERT_FALSE(courier::schema::succeeded(intent));
  EXPECT_EQ(courier::schema::error_of(intent).code,
            courier::schema::bridge_error_code::unauthorized_sender);
  EXPECT_FALSE(f.token().owner_of(77).has_value());
  EXPECT_FALSE(scope.receiver.processed(inbound.message_id));
  EXPECT_TRUE(scope.events.empty());
}

TEST(inbound_receiver, rejects_malformed_payload_without_minting) {
  auto f = courier::testing::chain_fixture{"courier_inbound_malformed", kLocal, 1};
  auto scope = receive_scope{f};
  auto inbound = make_inbound(scope.codec, 1, make_intent(77));
  inbound.payload.resize(inbound.payload.size() - 3);

  auto tx = f.ledger().begin();
  auto intent = scope.receiver.receive(f.router().address(), inbound);
  ASSERT_FALSE(courier::schema::succeeded(intent));
  EXPECT_EQ(courier::schema::error_of(intent).code,
            courier::schema::bridge_error_code::malformed_payload);
  EXPECT_FALSE(f.token().owner_of(77).has_value());
}

TEST(inbound_receiver, existing_token_is_duplicate) {
  auto f = courier::testing::chain_fixture{"courier_inbound_dup", kLocal, 1};
  auto scope = receive_scope{f};
  auto first = make_inbound(scope.codec, 1, make_intent(77));
  {
    auto tx = f.ledger().begin();
    ASSERT_TRUE(courier::schema::succeeded(
        scope.receiver.receive(f.router().address(), first)));
    tx.commit();
  }

  auto tx = f.ledger().begin();
  auto again = scope.receiver.receive(f.router().address(), first);
  ASSERT_FALSE(courier::schema::succeeded(again));
  EXPECT_EQ(courier::schema::error_of(again).code,
            courier::schema::bridge_error_code::duplicate_token_id);

  auto other_message = make_inbound(scope.codec, 2, make_intent(77));
  auto duplicate = scope.receiver.receive(f.router().address(), other_message);
  ASSERT_FALSE(courier::schema::succeeded(duplicate));
  EXPECT_EQ(courier::schema::error_of(duplicate).code,
            courier::schema::bridge_error_code::duplicate_token_id);
}

TEST(inbound_receiver, replay_after_token_left_is_rejected) {
  auto f = courier::testing::chain_fixture{"courier_inbound_replay", kLocal, 1};
  auto scope = receive_scope{f};
  auto inbound = make_inbound(scope.codec, 1, make_intent(77));
  {
    auto tx = f.ledger().begin();
    ASSERT_TRUE(courier::schema::succeeded(
        scope.receiver.receive(f.router().address(), inbound)));
    tx.commit();
  }
  f.setup([&] {
    ASSERT_TRUE(courier::schema::succeeded(
        f.token().burn(courier::testing::make_address(1, 40), 77)));
  });

  auto tx = f.ledger().begin();
  auto replayed = scope.receiver.receive(f.router().address(), inbound);
  ASSERT_FALSE(courier::schema::succeeded(replayed));
  EXPECT_EQ(courier::schema::error_of(replayed).code,
            courier::schema::bridge_error_code::message_already_processed);
}
