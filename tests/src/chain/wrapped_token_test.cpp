#include <courier/testing/chain_fixture.hpp>
#include <gtest/gtest.h>

#include <optional>

namespace {

constexpr courier::schema::chain_selector_t kLocal = 101;

}  // namespace

TEST(wrapped_token, only_minter_mints_and_ids_are_unique) {
  auto f = courier::testing::chain_fixture{"courier_token_mint", kLocal, 1};
  auto holder = courier::testing::make_address(1, 40);

  auto tx = f.ledger().begin();
  auto denied = f.token().mint_with_specific_id(holder, holder, 1);
  ASSERT_FALSE(courier::schema::succeeded(denied));
  EXPECT_EQ(courier::schema::error_of(denied).code,
            courier::schema::bridge_error_code::unauthorized_caller);

  ASSERT_TRUE(courier::schema::succeeded(
      f.token().mint_with_specific_id(f.bridge_address(), holder, 1)));
  auto duplicate =
      f.token().mint_with_specific_id(f.bridge_address(), holder, 1);
  ASSERT_FALSE(courier::schema::succeeded(duplicate));
  EXPECT_EQ(courier::schema::error_of(duplicate).code,
            courier::schema::bridge_error_code::duplicate_token_id);
  EXPECT_EQ(f.token().owner_of(1), std::optional{holder});
}

TEST(wrapped_token, transfer_requires_owner_approval_or_operator) {
  auto f = courier::testing::chain_fixture{"courier_token_transfer", kLocal, 1};
  auto holder = courier::testing::make_address(1, 40);
  auto spender = courier::testing::make_address(1, 41);
  auto recipient = courier::testing::make_address(1, 42);
  f.setup([&] {
    ASSERT_TRUE(courier::schema::succeeded(
        f.token().mint_with_specific_id(f.bridge_address(), holder, 1)));
  });

  auto tx = f.ledger().begin();
  auto denied = f.token().transfer_from(spender, holder, recipient, 1);
  ASSERT_FALSE(courier::schema::succeeded(denied));
  EXPECT_EQ(courier::schema::error_of(denied).code,
            courier::schema::bridge_error_code::transfer_not_authorized);

  ASSERT_TRUE(
      courier::schema::succeeded(f.token().approve(holder, spender, 1)));
  EXPECT_EQ(f.token().get_approved(1), std::optional{spender});
  ASSERT_TRUE(courier::schema::succeeded(
      f.token().transfer_from(spender, holder, recipient, 1)));
  EXPECT_EQ(f.token().owner_of(1), std::optional{recipient});
  EXPECT_FALSE(f.token().get_approved(1).has_value());

  f.token().set_approval_for_all(recipient, spender, true);
  EXPECT_TRUE(f.token().is_approved_for_all(recipient, spender));
  ASSERT_TRUE(courier::schema::succeeded(
      f.token().transfer_from(spender, recipient, holder, 1)));
  EXPECT_EQ(f.token().owner_of(1), std::optional{holder});

  auto missing = f.token().transfer_from(holder, holder, recipient, 2);
  ASSERT_FALSE(courier::schema::succeeded(missing));
  EXPECT_EQ(courier::schema::error_of(missing).code,
            courier::schema::bridge_error_code::token_missing);
}

TEST(wrapped_token, burn_requires_owner) {
  auto f = courier::testing::chain_fixture{"courier_token_burn", kLocal, 1};
  auto holder = courier::testing::make_address(1, 40);
  f.setup([&] {
    ASSERT_TRUE(courier::schema::succeeded(
        f.token().mint_with_specific_id(f.bridge_address(), holder, 1)));
  });

  auto tx = f.ledger().begin();
  auto denied = f.token().burn(f.bridge_address(), 1);
  ASSERT_FALSE(courier::schema::succeeded(denied));
  EXPECT_EQ(courier::schema::error_of(denied).code,
            courier::schema::bridge_error_code::transfer_not_authorized);
  ASSERT_TRUE(courier::schema::succeeded(f.token().burn(holder, 1)));
  EXPECT_FALSE(f.token().owner_of(1).has_value());
}

TEST(fee_asset, transfer_from_consumes_allowance) {
  auto f = courier::testing::chain_fixture{"courier_fee_allowance", kLocal, 1};
  auto payer = courier::testing::make_address(1, 40);
  auto spender = courier::testing::make_address(1, 41);
  f.setup([&] { f.fees().mint(payer, 1'000); });

  auto tx = f.ledger().begin();
  EXPECT_TRUE(f.fees().approve(payer, spender, 300));
  EXPECT_TRUE(f.fees().approve(payer, spender, 200));
  EXPECT_EQ(f.fees().allowance(payer, spender), courier::schema::amount_t{200});

  auto over = f.fees().transfer_from(spender, payer, spender, 250);
  ASSERT_FALSE(courier::schema::succeeded(over));
  const auto& error = courier::schema::error_of(over);
  EXPECT_EQ(error.code,
            courier::schema::bridge_error_code::insufficient_allowance);
  EXPECT_EQ(error.current, std::optional<courier::schema::amount_t>{200});
  EXPECT_EQ(error.required, std::optional<courier::schema::amount_t>{250});

  ASSERT_TRUE(courier::schema::succeeded(
      f.fees().transfer_from(spender, payer, spender, 150)));
  EXPECT_EQ(f.fees().allowance(payer, spender), courier::schema::amount_t{50});
  EXPECT_EQ(f.fees().balance_of(payer), courier::schema::amount_t{850});
  EXPECT_EQ(f.fees().balance_of(spender), courier::schema::amount_t{150});
  EXPECT_FALSE(f.fees().approve(payer, courier::schema::make_zero_address(), 1));
}

TEST(fee_asset, transfer_rejects_overdraft) {
  auto f = courier::testing::chain_fixture{"courier_fee_overdraft", kLocal, 1};
  auto payer = courier::testing::make_address(1, 40);
  f.setup([&] { f.fees().mint(payer, 10); });

  auto tx = f.ledger().begin();
  auto overdraft =
      f.fees().transfer(payer, courier::testing::make_address(1, 41), 11);
  ASSERT_FALSE(courier::schema::succeeded(overdraft));
  EXPECT_EQ(courier::schema::error_of(overdraft).code,
            courier::schema::bridge_error_code::insufficient_balance);
  EXPECT_EQ(f.fees().balance_of(payer), courier::schema::amount_t{10});
}
