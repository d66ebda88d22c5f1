#include <spdlog/spdlog.h>
#include <courier/bridge/dispatcher.hpp>
#include <courier/schema/key/ledger_keys.hpp>
#include <map>
#include <utility>

using namespace courier::schema;

namespace courier::bridge {

dispatcher::dispatcher(courier::ledger::state& ledger,
                       const message_builder& builder,
                       relay_router& router,
                       fee_asset& fees,
                       const address_t& bridge_address,
                       event_sink_t sink)
    : ledger_{ledger},
      builder_{builder},
      router_{router},
      fees_{fees},
      bridge_address_{bridge_address},
      sink_{std::move(sink)} {}

outcome_t<message_receipt_t> dispatcher::send(
    const outbound_message_t& message) {
  auto quote = builder_.quote(message);
  if (!succeeded(quote)) {
    return error_of(quote);
  }
  const auto& fee = value_of(quote).amount;

  auto balance = fees_.balance_of(bridge_address_);
  if (balance < fee) {
    spdlog::warn("Fee balance {} below quoted fee {}", to_string(balance),
                 to_string(fee));
    return make_shortfall_error(
        bridge_error_code::insufficient_fee,
        "fee balance " + to_string(balance) + " below required " +
            to_string(fee),
        balance, fee);
  }

  if (!fees_.approve(bridge_address_, router_.address(), fee)) {
    spdlog::warn("Fee token {} refused approval of {} for router {}",
                 to_hex(fees_.address()), to_string(fee),
                 to_hex(router_.address()));
    return make_error(bridge_error_code::fee_approval_rejected,
                      "fee token rejected router approval");
  }

  auto message_id =
      router_.send(bridge_address_, message.destination_selector, message);
  if (!succeeded(message_id)) {
    spdlog::warn("Router rejected message to destination {}: {}",
                 message.destination_selector, error_of(message_id).message);
    return error_of(message_id);
  }

  auto receipt = message_receipt_t{.message_id = value_of(message_id),
                                   .destination_selector =
                                       message.destination_selector,
                                   .receiver = message.receiver,
                                   .fee_token = message.fee_token,
                                   .fee_paid = fee};
  record(receipt);
  spdlog::debug("Dispatched message {} to destination {} for fee {}",
                to_hex(receipt.message_id), receipt.destination_selector,
                to_string(fee));
  return receipt;
}

std::vector<message_receipt_t> dispatcher::receipts() const {
  auto& encoder = ledger_.encoder();
  auto prefix = key::make_receipt_prefix_key(encoder, bridge_address_);
  auto ordered = std::map<uint64_t, message_receipt_t>{};
  for (const auto& [key, value] :
       ledger_.list_by_prefix(bytes_view_t{prefix.data(), prefix.size()})) {
    auto sequence = key::parse_sequenced_key(
        encoder, bytes_view_t{key.data(), key.size()}, key::kReceiptKeyPrefix);
    if (!sequence.has_value()) {
      continue;
    }
    ordered.emplace(*sequence, encoder.decode<message_receipt_t>(
                                   bytes_view_t{value.data(), value.size()}));
  }

  auto out = std::vector<message_receipt_t>{};
  out.reserve(ordered.size());
  for (auto& [sequence, receipt] : ordered) {
    out.push_back(std::move(receipt));
  }
  return out;
}

void dispatcher::record(const message_receipt_t& receipt) {
  auto& encoder = ledger_.encoder();
  auto sequence_key = key::make_receipt_sequence_key(encoder, bridge_address_);
  auto sequence_view = bytes_view_t{sequence_key.data(), sequence_key.size()};
  auto next = ledger_.get<uint64_t>(sequence_view).value_or(1);

  auto receipt_key = key::make_receipt_key(encoder, bridge_address_, next);
  ledger_.put(bytes_view_t{receipt_key.data(), receipt_key.size()}, receipt);
  ledger_.put(sequence_view, next + 1);

  if (sink_) {
    sink_(make_message_sent_event(receipt));
  }
}

}  // namespace courier::bridge
