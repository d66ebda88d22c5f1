#pragma once

#include <courier/schema/primitives.hpp>
#include <cstdint>

// Schema type: message receipt.
// Bridge workflow: audit record of one accepted dispatch; emitted as the
// MessageSent event and appended to the bridge's persisted send log.
namespace courier::schema {

template <uint16_t Version>
struct message_receipt;

template <>
struct message_receipt<1> final {
  uint16_t version{1};
  message_id_t message_id{};
  chain_selector_t destination_selector{};
  address_t receiver{};
  address_t fee_token{};
  amount_t fee_paid{};

  bool operator==(const message_receipt<1>&) const = default;
};

using message_receipt_t = message_receipt<1>;

}  // namespace courier::schema
