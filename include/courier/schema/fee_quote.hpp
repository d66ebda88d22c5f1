#pragma once

#include <courier/schema/primitives.hpp>
#include <cstdint>

namespace courier::schema {

template <uint16_t Version>
struct fee_quote;

template <>
struct fee_quote<1> final {
  uint16_t version{1};
  amount_t amount{};
};

using fee_quote_t = fee_quote<1>;

}  // namespace courier::schema
