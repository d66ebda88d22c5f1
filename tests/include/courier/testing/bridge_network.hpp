#pragma once

#include <courier/chain/relay_network.hpp>
#include <courier/testing/chain_fixture.hpp>

#include <string>
#include <string_view>

namespace courier::testing {

/// Two chains with a bridge each, lanes open both ways and a relay that
/// knows both bridges.
class bridge_network final {
 public:
  static constexpr courier::schema::chain_selector_t kChainA = 1001;
  static constexpr courier::schema::chain_selector_t kChainB = 2002;

  explicit bridge_network(const std::string_view db_prefix,
                          const courier::schema::mint_policy policy_a =
                              courier::schema::mint_policy::open)
      : a_{std::string{db_prefix} + "_a", kChainA, 1, policy_a},
        b_{std::string{db_prefix} + "_b", kChainB, 2} {
    a_.open_lane(kChainB);
    b_.open_lane(kChainA);
    relay_.register_host(a_.ledger(), a_.router());
    relay_.register_host(b_.ledger(), b_.router());
    relay_.register_receiver(kChainA, a_.bridge_address(), a_.bridge());
    relay_.register_receiver(kChainB, b_.bridge_address(), b_.bridge());
  }

  bridge_network(const bridge_network&) = delete;
  bridge_network& operator=(const bridge_network&) = delete;

  chain_fixture& a() { return a_; }
  chain_fixture& b() { return b_; }
  courier::chain::relay_network& relay() { return relay_; }

 private:
  chain_fixture a_;
  chain_fixture b_;
  courier::chain::relay_network relay_;
};

}  // namespace courier::testing
