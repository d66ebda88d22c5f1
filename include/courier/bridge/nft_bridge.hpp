#pragma once

#include <courier/bridge/bridge_config.hpp>
#include <courier/bridge/collaborators.hpp>
#include <courier/bridge/custody_manager.hpp>
#include <courier/bridge/dispatcher.hpp>
#include <courier/bridge/inbound_receiver.hpp>
#include <courier/bridge/message_builder.hpp>
#include <courier/bridge/payload_codec.hpp>
#include <courier/ledger/state.hpp>
#include <courier/schema/inbound_message.hpp>
#include <courier/schema/message_receipt.hpp>
#include <courier/schema/primitives.hpp>
#include <courier/schema/transaction_event.hpp>
#include <courier/schema/transaction_result.hpp>
#include <courier/schema/transfer_intent.hpp>
#include <mutex>
#include <string_view>
#include <vector>

namespace courier::bridge {

/// Public entry points of one bridge deployment on one chain.
///
/// Every entry point is a single serialized ledger transaction: it either
/// commits all of its writes (custody changes, fee movement, router outbox,
/// receipts, events) or none of them. Failures come back as a
/// transaction_result_t whose code is the bridge_error_code of the innermost
/// failing step.
///
/// The injected collaborators must write to the same ledger as the bridge so
/// their effects share the transaction.
///
/// Entry points hold a non-recursive lock for the whole transaction,
/// including every collaborator call. A collaborator must not call back into
/// this bridge: a router that delivers synchronously into receive() on the
/// same instance deadlocks. Relays deliver after the sending entry point has
/// returned, as chain::relay_network::deliver() does.
///
/// bridge_out and originate_mint reject a zero new owner or a zero
/// destination receiver with invalid_recipient before any custody change.
class nft_bridge final {
 public:
  nft_bridge(bridge_config config,
             courier::ledger::state& ledger,
             wrapped_token& token,
             fee_asset& fees,
             relay_router& router);

  nft_bridge(const nft_bridge&) = delete;
  nft_bridge& operator=(const nft_bridge&) = delete;

  /// Request a fresh token for `caller` on the destination chain. On success
  /// `data` holds the 32-byte message id.
  courier::schema::transaction_result_t originate_mint(
      const courier::schema::address_t& caller,
      courier::schema::chain_selector_t destination_selector,
      const courier::schema::address_t& receiver);

  /// Burn `token_id` here and ask `destination_receiver` to mint it to
  /// `new_owner`. On success `data` holds the 32-byte message id.
  courier::schema::transaction_result_t bridge_out(
      const courier::schema::address_t& caller,
      const courier::schema::token_id_t& token_id,
      const courier::schema::address_t& new_owner,
      courier::schema::chain_selector_t destination_selector,
      const courier::schema::address_t& destination_receiver);

  /// Relay delivery callback; only the router may call it.
  courier::schema::transaction_result_t receive(
      const courier::schema::address_t& caller,
      const courier::schema::inbound_message_t& message);

  /// Owner-only: move the whole fee-token balance to `beneficiary`.
  courier::schema::transaction_result_t withdraw_fees(
      const courier::schema::address_t& caller,
      const courier::schema::address_t& beneficiary);

  /// MessageSent audit trail in dispatch order.
  std::vector<courier::schema::message_receipt_t> sent_messages() const;

  bool processed(const courier::schema::message_id_t& message_id) const;

  const bridge_config& config() const;

 private:
  template <typename Body>
  courier::schema::transaction_result_t run(std::string_view codespace,
                                            Body&& body);

  courier::schema::outcome_t<courier::schema::message_receipt_t> send_intent(
      const courier::schema::transfer_intent_t& intent,
      courier::schema::chain_selector_t destination_selector,
      const courier::schema::address_t& receiver);

  courier::schema::token_id_t next_originated_token_id();
  void emit(const courier::schema::transaction_event_t& event);

  mutable std::mutex mutex_;
  bridge_config config_;
  courier::ledger::state& ledger_;
  wrapped_token& token_;
  fee_asset& fees_;
  relay_router& router_;
  payload_codec codec_;
  message_builder builder_;
  custody_manager custody_;
  dispatcher dispatcher_;
  inbound_receiver receiver_;
  std::vector<courier::schema::transaction_event_t> emitted_;
};

/// Token ids originated by a chain: selector in the top 64 bits, a per-bridge
/// sequence in the low bits.
courier::schema::token_id_t make_originated_token_id(
    courier::schema::chain_selector_t chain_selector,
    uint64_t sequence);

}  // namespace courier::bridge
