#pragma once

#include <courier/schema/outbound_message.hpp>
#include <courier/schema/primitives.hpp>
#include <cstdint>

// Schema type: routed message.
// Relay workflow: outbox record written by the local router in the same
// transaction that collects the fee.
namespace courier::schema {

template <uint16_t Version>
struct routed_message;

template <>
struct routed_message<1> final {
  uint16_t version{1};
  message_id_t message_id{};
  chain_selector_t source_chain_selector{};
  address_t sender{};
  outbound_message_t message;
  amount_t fee_paid{};
};

using routed_message_t = routed_message<1>;

}  // namespace courier::schema
