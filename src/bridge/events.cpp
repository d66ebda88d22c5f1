#include <courier/bridge/events.hpp>
#include <string>

using namespace courier::schema;

namespace courier::bridge {

transaction_event_t make_message_sent_event(const message_receipt_t& receipt) {
  return transaction_event_t{
      .type = std::string{kMessageSentEvent},
      .attributes = {
          {.key = "message_id", .value = to_hex(receipt.message_id), .index = true},
          {.key = "destination_selector",
           .value = std::to_string(receipt.destination_selector),
           .index = true},
          {.key = "receiver", .value = to_hex(receipt.receiver), .index = true},
          {.key = "fee_token", .value = to_hex(receipt.fee_token)},
          {.key = "fee", .value = to_string(receipt.fee_paid)}}};
}

transaction_event_t make_message_received_event(
    const inbound_message_t& message,
    const transfer_intent_t& intent) {
  return transaction_event_t{
      .type = std::string{kMessageReceivedEvent},
      .attributes = {
          {.key = "message_id", .value = to_hex(message.message_id), .index = true},
          {.key = "source_chain_selector",
           .value = std::to_string(message.source_chain_selector),
           .index = true},
          {.key = "source_sender", .value = to_hex(message.source_sender)},
          {.key = "token_id", .value = to_string(intent.token_id), .index = true},
          {.key = "new_owner", .value = to_hex(intent.new_owner)}}};
}

transaction_event_t make_fees_withdrawn_event(const address_t& fee_token,
                                              const address_t& beneficiary,
                                              const amount_t& amount) {
  return transaction_event_t{
      .type = std::string{kFeesWithdrawnEvent},
      .attributes = {{.key = "fee_token", .value = to_hex(fee_token)},
                     {.key = "beneficiary", .value = to_hex(beneficiary), .index = true},
                     {.key = "amount", .value = to_string(amount)}}};
}

std::string_view find_attribute(const transaction_event_t& event,
                                const std::string_view key) {
  for (const auto& attribute : event.attributes) {
    if (attribute.key == key) {
      return attribute.value;
    }
  }
  return {};
}

}  // namespace courier::bridge
