#include <gtest/gtest.h>
#include <courier/schema/bridge_error_code.hpp>
#include <courier/schema/mint_policy.hpp>
#include <courier/schema/primitives.hpp>

TEST(primitives, make_hash32_from_bytes_copies_input) {
  auto input = courier::schema::bytes_t(32, 0xAB);
  auto hash = courier::schema::make_hash32(input);
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, try_make_hash32_rejects_wrong_length) {
  EXPECT_FALSE(courier::schema::try_make_hash32("0x0102").has_value());
  auto hash = courier::schema::try_make_hash32(
      "0x0102030405060708090a0b0c0d0e0f10"
      "1112131415161718191a1b1c1d1e1f20");
  ASSERT_TRUE(hash.has_value());
  EXPECT_EQ((*hash)[0], 0x01);
  EXPECT_EQ((*hash)[31], 0x20);
}

TEST(primitives, address_hex_accepts_optional_prefix) {
  auto with_prefix = courier::schema::try_make_address(
      "0x00112233445566778899aabbccddeeff00112233");
  auto without_prefix = courier::schema::try_make_address(
      "00112233445566778899AABBCCDDEEFF00112233");
  ASSERT_TRUE(with_prefix.has_value());
  ASSERT_TRUE(without_prefix.has_value());
  EXPECT_EQ(*with_prefix, *without_prefix);
  EXPECT_EQ(courier::schema::to_hex(*with_prefix),
            "0x00112233445566778899aabbccddeeff00112233");
}

TEST(primitives, try_make_address_rejects_bad_input) {
  EXPECT_FALSE(courier::schema::try_make_address("0x1234").has_value());
  EXPECT_FALSE(courier::schema::try_make_address(
                   "0xzz112233445566778899aabbccddeeff00112233")
                   .has_value());
  EXPECT_FALSE(courier::schema::try_make_address(
                   "0x00112233445566778899aabbccddeeff0011223")
                   .has_value());
}

TEST(primitives, zero_address_is_zero) {
  EXPECT_TRUE(courier::schema::is_zero(courier::schema::make_zero_address()));
  auto address = courier::schema::make_zero_address();
  address[19] = 1;
  EXPECT_FALSE(courier::schema::is_zero(address));
}

TEST(primitives, uint256_renders_in_decimal) {
  auto value = courier::schema::amount_t{1} << 200;
  EXPECT_EQ(courier::schema::to_string(value),
            "1606938044258990275541962092341162602522202993782792835301376");
  EXPECT_EQ(courier::schema::to_string(courier::schema::amount_t{0}), "0");
}

TEST(primitives, error_code_names_are_stable) {
  using courier::schema::bridge_error_code;
  EXPECT_EQ(static_cast<uint32_t>(bridge_error_code::malformed_payload), 1u);
  EXPECT_EQ(static_cast<uint32_t>(bridge_error_code::duplicate_token_id), 8u);
  EXPECT_EQ(courier::schema::to_string(bridge_error_code::insufficient_fee),
            "insufficient_fee");
  EXPECT_EQ(courier::schema::try_from_string<bridge_error_code>(
                "message_already_processed"),
            bridge_error_code::message_already_processed);
  EXPECT_FALSE(
      courier::schema::try_from_string<bridge_error_code>("nope").has_value());
}

TEST(primitives, mint_policy_parses_names) {
  using courier::schema::mint_policy;
  EXPECT_EQ(courier::schema::try_from_string<mint_policy>("owner_only"),
            mint_policy::owner_only);
  EXPECT_EQ(courier::schema::to_string(mint_policy::open), "open");
  EXPECT_FALSE(
      courier::schema::try_from_string<mint_policy>("closed").has_value());
}

TEST(primitives, describe_names_lists_every_mapping_in_order) {
  EXPECT_EQ(courier::schema::describe_names(courier::schema::kMintPolicyMappings),
            "open | owner_only");
}
