#pragma once

#include <courier/bridge/collaborators.hpp>
#include <courier/bridge/events.hpp>
#include <courier/bridge/message_builder.hpp>
#include <courier/ledger/state.hpp>
#include <courier/schema/bridge_error.hpp>
#include <courier/schema/message_receipt.hpp>
#include <courier/schema/outbound_message.hpp>
#include <courier/schema/primitives.hpp>
#include <cstdint>
#include <vector>

namespace courier::bridge {

/// Pays for and submits outbound messages.
///
/// Steps run strictly in order and each is a precondition for the next:
/// quote, balance check, exact approval, submit, receipt. Nothing is retried;
/// a failure after the approval is undone by the entry point's rollback.
class dispatcher final {
 public:
  dispatcher(courier::ledger::state& ledger,
             const message_builder& builder,
             relay_router& router,
             fee_asset& fees,
             const courier::schema::address_t& bridge_address,
             event_sink_t sink);

  courier::schema::outcome_t<courier::schema::message_receipt_t> send(
      const courier::schema::outbound_message_t& message);

  /// Persisted MessageSent receipts in dispatch order.
  std::vector<courier::schema::message_receipt_t> receipts() const;

 private:
  void record(const courier::schema::message_receipt_t& receipt);

  courier::ledger::state& ledger_;
  const message_builder& builder_;
  relay_router& router_;
  fee_asset& fees_;
  courier::schema::address_t bridge_address_;
  event_sink_t sink_;
};

}  // namespace courier::bridge
