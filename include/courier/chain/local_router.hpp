#pragma once

#include <courier/bridge/collaborators.hpp>
#include <courier/chain/fee_asset.hpp>
#include <courier/ledger/state.hpp>
#include <courier/schema/bridge_error.hpp>
#include <courier/schema/outbound_message.hpp>
#include <courier/schema/primitives.hpp>
#include <courier/schema/routed_message.hpp>
#include <map>
#include <optional>
#include <vector>

namespace courier::chain {

/// Price of one message to a destination:
/// base_fee + fee_per_payload_byte * |payload| + fee_per_gas_unit * gas_limit.
struct fee_schedule final {
  courier::schema::amount_t base_fee{};
  courier::schema::amount_t fee_per_payload_byte{};
  courier::schema::amount_t fee_per_gas_unit{};
};

/// Router of the message-relay network on one chain.
///
/// `send` collects the quoted fee from the caller through the fee asset and
/// appends the message to an outbox in the host ledger; both effects belong
/// to the caller's transaction. `address()` is also the account the relay
/// uses to deliver inbound messages on this chain.
class local_router final : public courier::bridge::relay_router {
 public:
  local_router(courier::ledger::state& ledger,
               fee_asset& fees,
               const courier::schema::address_t& self,
               courier::schema::chain_selector_t chain_selector);

  const courier::schema::address_t& address() const override;
  courier::schema::chain_selector_t chain_selector() const;

  void set_destination(courier::schema::chain_selector_t destination_selector,
                       const fee_schedule& schedule);
  void remove_destination(courier::schema::chain_selector_t destination_selector);

  void set_online(bool online);
  bool online() const;

  courier::schema::outcome_t<courier::schema::amount_t> get_fee(
      courier::schema::chain_selector_t destination_selector,
      const courier::schema::outbound_message_t& message) const override;

  courier::schema::outcome_t<courier::schema::message_id_t> send(
      const courier::schema::address_t& caller,
      courier::schema::chain_selector_t destination_selector,
      const courier::schema::outbound_message_t& message) override;

  /// Accepted messages in acceptance order.
  std::vector<courier::schema::routed_message_t> outbox() const;

  std::optional<courier::schema::routed_message_t> find(
      const courier::schema::message_id_t& message_id) const;

  bool delivered(const courier::schema::message_id_t& message_id) const;

  /// Requires an open ledger transaction.
  void mark_delivered(const courier::schema::message_id_t& message_id);

 private:
  courier::ledger::state& ledger_;
  fee_asset& fees_;
  courier::schema::address_t self_;
  courier::schema::chain_selector_t chain_selector_;
  std::map<courier::schema::chain_selector_t, fee_schedule> destinations_;
  bool online_{true};
};

}  // namespace courier::chain
