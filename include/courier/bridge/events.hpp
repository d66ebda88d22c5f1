#pragma once

#include <courier/schema/inbound_message.hpp>
#include <courier/schema/message_receipt.hpp>
#include <courier/schema/primitives.hpp>
#include <courier/schema/transaction_event.hpp>
#include <courier/schema/transfer_intent.hpp>
#include <functional>
#include <string_view>

namespace courier::bridge {

inline constexpr std::string_view kMessageSentEvent{"MessageSent"};
inline constexpr std::string_view kMessageReceivedEvent{"MessageReceived"};
inline constexpr std::string_view kFeesWithdrawnEvent{"FeesWithdrawn"};

/// Receives every event an entry point emits, in emission order.
using event_sink_t =
    std::function<void(const courier::schema::transaction_event_t&)>;

courier::schema::transaction_event_t make_message_sent_event(
    const courier::schema::message_receipt_t& receipt);

courier::schema::transaction_event_t make_message_received_event(
    const courier::schema::inbound_message_t& message,
    const courier::schema::transfer_intent_t& intent);

courier::schema::transaction_event_t make_fees_withdrawn_event(
    const courier::schema::address_t& fee_token,
    const courier::schema::address_t& beneficiary,
    const courier::schema::amount_t& amount);

/// Value of the first attribute named `key`, or empty when absent.
std::string_view find_attribute(const courier::schema::transaction_event_t& event,
                                std::string_view key);

}  // namespace courier::bridge
