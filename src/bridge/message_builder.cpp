#include <spdlog/spdlog.h>
#include <courier/bridge/message_builder.hpp>
#include <utility>

using namespace courier::schema;

namespace courier::bridge {

message_builder::message_builder(const relay_router& router)
    : router_{router} {}

outbound_message_t message_builder::build(
    const chain_selector_t destination_selector,
    const address_t& receiver,
    bytes_t payload,
    const uint64_t gas_limit,
    const address_t& fee_token) const {
  return outbound_message_t{.destination_selector = destination_selector,
                            .receiver = receiver,
                            .payload = std::move(payload),
                            .fee_token = fee_token,
                            .gas_limit = gas_limit};
}

outcome_t<fee_quote_t> message_builder::quote(
    const outbound_message_t& message) const {
  auto fee = router_.get_fee(message.destination_selector, message);
  if (!succeeded(fee)) {
    spdlog::warn("Router refused to quote destination {}: {}",
                 message.destination_selector, error_of(fee).message);
    return error_of(fee);
  }
  spdlog::debug("Quoted {} for {} byte payload to destination {}",
                to_string(value_of(fee)), message.payload.size(),
                message.destination_selector);
  return fee_quote_t{.amount = value_of(fee)};
}

}  // namespace courier::bridge
