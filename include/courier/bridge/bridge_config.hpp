#pragma once

#include <courier/common/logging.hpp>
#include <courier/schema/bridge_error.hpp>
#include <courier/schema/mint_policy.hpp>
#include <courier/schema/primitives.hpp>
#include <cstdint>
#include <istream>
#include <string_view>

namespace courier::bridge {

/// Destination-side execution budget attached to every outbound message.
inline constexpr uint64_t kDefaultGasLimit = 200'000;

/// Construction-time configuration of one bridge instance.
///
/// Router and fee token are named explicitly so the injected collaborators can
/// be checked against them; nothing is read from ambient state.
struct bridge_config final {
  courier::schema::address_t self_address{};
  courier::schema::address_t owner{};
  courier::schema::address_t router{};
  courier::schema::address_t fee_token{};
  courier::schema::chain_selector_t chain_selector{};
  uint64_t gas_limit{kDefaultGasLimit};
  courier::schema::mint_policy origination_policy{
      courier::schema::mint_policy::open};
};

struct node_config final {
  bridge_config bridge;
  courier::common::logging_config logging;
};

courier::schema::status_t validate_bridge_config(const bridge_config& config);

/// Parse an INI-style configuration:
///
///   [bridge]
///   self_address = 0x...
///   owner = 0x...
///   router = 0x...
///   fee_token = 0x...
///   chain_selector = 16015286601757825753
///   gas_limit = 200000
///   mint_policy = open | owner_only
///
///   [logging]
///   level = info
///   file = courier.log
courier::schema::outcome_t<node_config> load_node_config(std::istream& input);
courier::schema::outcome_t<node_config> load_node_config_file(
    std::string_view path);

}  // namespace courier::bridge
