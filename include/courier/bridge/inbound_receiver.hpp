#pragma once

#include <courier/bridge/collaborators.hpp>
#include <courier/bridge/events.hpp>
#include <courier/bridge/payload_codec.hpp>
#include <courier/ledger/state.hpp>
#include <courier/schema/bridge_error.hpp>
#include <courier/schema/inbound_message.hpp>
#include <courier/schema/primitives.hpp>
#include <courier/schema/transfer_intent.hpp>

namespace courier::bridge {

/// Applies relay-delivered transfer intents as local mints.
///
/// Admission is the router check alone; the relay has already authenticated
/// the source chain and sender. Order of checks: router, payload, mint
/// (duplicate_token_id), processed message id (message_already_processed).
class inbound_receiver final {
 public:
  inbound_receiver(courier::ledger::state& ledger,
                   const payload_codec& codec,
                   wrapped_token& token,
                   const courier::schema::address_t& bridge_address,
                   const courier::schema::address_t& router_address,
                   event_sink_t sink);

  courier::schema::outcome_t<courier::schema::transfer_intent_t> receive(
      const courier::schema::address_t& caller,
      const courier::schema::inbound_message_t& message);

  bool processed(const courier::schema::message_id_t& message_id) const;

 private:
  courier::ledger::state& ledger_;
  const payload_codec& codec_;
  wrapped_token& token_;
  courier::schema::address_t bridge_address_;
  courier::schema::address_t router_address_;
  event_sink_t sink_;
};

}  // namespace courier::bridge
