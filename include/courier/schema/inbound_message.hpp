#pragma once

#include <courier/schema/primitives.hpp>
#include <cstdint>

// Schema type: inbound message.
// Bridge workflow: what the relay delivers to the destination bridge.
namespace courier::schema {

template <uint16_t Version>
struct inbound_message;

template <>
struct inbound_message<1> final {
  uint16_t version{1};
  message_id_t message_id{};
  chain_selector_t source_chain_selector{};
  address_t source_sender{};
  bytes_t payload;
};

using inbound_message_t = inbound_message<1>;

}  // namespace courier::schema
