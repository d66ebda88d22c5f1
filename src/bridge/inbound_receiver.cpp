#include <spdlog/spdlog.h>
#include <courier/bridge/inbound_receiver.hpp>
#include <courier/schema/key/ledger_keys.hpp>
#include <utility>

using namespace courier::schema;

namespace courier::bridge {

inbound_receiver::inbound_receiver(courier::ledger::state& ledger,
                                   const payload_codec& codec,
                                   wrapped_token& token,
                                   const address_t& bridge_address,
                                   const address_t& router_address,
                                   event_sink_t sink)
    : ledger_{ledger},
      codec_{codec},
      token_{token},
      bridge_address_{bridge_address},
      router_address_{router_address},
      sink_{std::move(sink)} {}

outcome_t<transfer_intent_t> inbound_receiver::receive(
    const address_t& caller,
    const inbound_message_t& message) {
  if (caller != router_address_) {
    spdlog::warn("Rejected inbound message {} from {}",
                 to_hex(message.message_id), to_hex(caller));
    return make_error(bridge_error_code::unauthorized_sender,
                      to_hex(caller) + " is not the relay router");
  }

  auto intent = codec_.decode(
      bytes_view_t{message.payload.data(), message.payload.size()});
  if (!succeeded(intent)) {
    return error_of(intent);
  }
  const auto& decoded = value_of(intent);

  auto minted = token_.mint_with_specific_id(bridge_address_,
                                             decoded.new_owner,
                                             decoded.token_id);
  if (!succeeded(minted)) {
    return error_of(minted);
  }

  auto processed_key = key::make_processed_message_key(
      ledger_.encoder(), bridge_address_, message.message_id);
  auto processed_view =
      bytes_view_t{processed_key.data(), processed_key.size()};
  if (ledger_.contains(processed_view)) {
    return make_error(bridge_error_code::message_already_processed,
                      "message " + to_hex(message.message_id) +
                          " was already applied");
  }
  ledger_.put(processed_view, message.source_chain_selector);

  if (sink_) {
    sink_(make_message_received_event(message, decoded));
  }
  spdlog::debug("Minted token {} to {} from message {}",
                to_string(decoded.token_id), to_hex(decoded.new_owner),
                to_hex(message.message_id));
  return decoded;
}

bool inbound_receiver::processed(const message_id_t& message_id) const {
  auto processed_key = key::make_processed_message_key(
      ledger_.encoder(), bridge_address_, message_id);
  return ledger_.contains(
      bytes_view_t{processed_key.data(), processed_key.size()});
}

}  // namespace courier::bridge
