#pragma once

#include <courier/bridge/nft_bridge.hpp>
#include <courier/chain/local_router.hpp>
#include <courier/ledger/state.hpp>
#include <courier/schema/primitives.hpp>
#include <courier/schema/transaction_result.hpp>
#include <map>
#include <optional>
#include <vector>

namespace courier::chain {

/// One delivery attempt of a routed message.
struct delivery_t final {
  courier::schema::message_id_t message_id{};
  courier::schema::chain_selector_t source_chain_selector{};
  courier::schema::chain_selector_t destination_selector{};
  courier::schema::transaction_result_t result;
};

/// In-process stand-in for the off-chain relay.
///
/// Reads router outboxes of every registered chain and hands each message to
/// the receiver registered on its destination chain, calling in as the
/// destination router. Delivery is at-least-once: `deliver` only skips
/// messages already marked delivered, and `redeliver` replays on demand.
class relay_network final {
 public:
  /// The router's chain selector identifies the host.
  void register_host(courier::ledger::state& ledger, local_router& router);

  void register_receiver(courier::schema::chain_selector_t chain_selector,
                         const courier::schema::address_t& receiver,
                         courier::bridge::nft_bridge& bridge);

  /// Hand every undelivered message to its destination. Messages whose
  /// destination chain or receiver is unknown stay in the outbox.
  std::vector<delivery_t> deliver();

  /// Deliver one message again regardless of its delivered mark.
  std::optional<delivery_t> redeliver(
      const courier::schema::message_id_t& message_id);

 private:
  struct host_t final {
    courier::ledger::state* ledger{nullptr};
    local_router* router{nullptr};
    std::map<courier::schema::address_t, courier::bridge::nft_bridge*>
        receivers;
  };

  std::optional<delivery_t> deliver_one(
      host_t& source,
      const courier::schema::routed_message_t& routed);

  std::map<courier::schema::chain_selector_t, host_t> hosts_;
};

}  // namespace courier::chain
