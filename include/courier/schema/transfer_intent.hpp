#pragma once

#include <courier/schema/primitives.hpp>
#include <cstdint>

// Schema type: transfer intent.
// Bridge workflow: the only payload carried across chains; names the token id
// to (re)mint and the account that receives it on the destination chain.
namespace courier::schema {

template <uint16_t Version>
struct transfer_intent;

template <>
struct transfer_intent<1> final {
  uint16_t version{1};
  token_id_t token_id{};
  address_t new_owner{};

  bool operator==(const transfer_intent<1>&) const = default;
};

using transfer_intent_t = transfer_intent<1>;

}  // namespace courier::schema
