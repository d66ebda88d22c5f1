#pragma once

#include <courier/bridge/collaborators.hpp>
#include <courier/schema/bridge_error.hpp>
#include <courier/schema/fee_quote.hpp>
#include <courier/schema/outbound_message.hpp>
#include <courier/schema/primitives.hpp>

namespace courier::bridge {

/// Assembles fee-bounded outbound messages and prices them with the router.
class message_builder final {
 public:
  explicit message_builder(const relay_router& router);

  courier::schema::outbound_message_t build(
      courier::schema::chain_selector_t destination_selector,
      const courier::schema::address_t& receiver,
      courier::schema::bytes_t payload,
      uint64_t gas_limit,
      const courier::schema::address_t& fee_token) const;

  /// Fresh quote for exactly this message. Quotes are never cached: a
  /// changed message or a later transaction must ask again.
  courier::schema::outcome_t<courier::schema::fee_quote_t> quote(
      const courier::schema::outbound_message_t& message) const;

 private:
  const relay_router& router_;
};

}  // namespace courier::bridge
