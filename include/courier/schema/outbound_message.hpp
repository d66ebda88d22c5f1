#pragma once

#include <courier/schema/primitives.hpp>
#include <cstdint>

// Schema type: outbound message.
// Bridge workflow: fee-bounded message handed to the relay router; built per
// send and never persisted by the bridge.
namespace courier::schema {

template <uint16_t Version>
struct outbound_message;

template <>
struct outbound_message<1> final {
  uint16_t version{1};
  chain_selector_t destination_selector{};
  address_t receiver{};
  bytes_t payload;
  address_t fee_token{};
  uint64_t gas_limit{};

  bool operator==(const outbound_message<1>&) const = default;
};

using outbound_message_t = outbound_message<1>;

}  // namespace courier::schema
