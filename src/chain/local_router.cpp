#include <spdlog/spdlog.h>
#include <courier/blake3/hash.hpp>
#include <courier/chain/local_router.hpp>
#include <courier/schema/key/ledger_keys.hpp>
#include <tuple>

using namespace courier::schema;

namespace {

bytes_view_t view(const bytes_t& key) {
  return bytes_view_t{key.data(), key.size()};
}

}  // namespace

namespace courier::chain {

local_router::local_router(courier::ledger::state& ledger,
                           fee_asset& fees,
                           const address_t& self,
                           const chain_selector_t chain_selector)
    : ledger_{ledger},
      fees_{fees},
      self_{self},
      chain_selector_{chain_selector} {}

const address_t& local_router::address() const {
  return self_;
}

chain_selector_t local_router::chain_selector() const {
  return chain_selector_;
}

void local_router::set_destination(const chain_selector_t destination_selector,
                                   const fee_schedule& schedule) {
  destinations_.insert_or_assign(destination_selector, schedule);
}

void local_router::remove_destination(
    const chain_selector_t destination_selector) {
  destinations_.erase(destination_selector);
}

void local_router::set_online(const bool online) {
  online_ = online;
  spdlog::info("Router {} on chain {} is {}", to_hex(self_), chain_selector_,
               online ? "online" : "offline");
}

bool local_router::online() const {
  return online_;
}

outcome_t<amount_t> local_router::get_fee(
    const chain_selector_t destination_selector,
    const outbound_message_t& message) const {
  if (!online_) {
    return make_error(bridge_error_code::relay_unavailable,
                      "router is offline");
  }
  auto it = destinations_.find(destination_selector);
  if (it == std::end(destinations_)) {
    return make_error(bridge_error_code::unsupported_destination,
                      "no lane to chain " +
                          std::to_string(destination_selector));
  }
  if (message.fee_token != fees_.address()) {
    return make_error(bridge_error_code::relay_unavailable,
                      "fee token " + to_hex(message.fee_token) +
                          " is not accepted");
  }
  const auto& schedule = it->second;
  return schedule.base_fee +
         schedule.fee_per_payload_byte * amount_t{message.payload.size()} +
         schedule.fee_per_gas_unit * amount_t{message.gas_limit};
}

outcome_t<message_id_t> local_router::send(
    const address_t& caller,
    const chain_selector_t destination_selector,
    const outbound_message_t& message) {
  auto fee = get_fee(destination_selector, message);
  if (!succeeded(fee)) {
    return error_of(fee);
  }
  auto collected =
      fees_.transfer_from(self_, caller, self_, value_of(fee));
  if (!succeeded(collected)) {
    return error_of(collected);
  }

  auto& encoder = ledger_.encoder();
  auto sequence_key = key::make_router_sequence_key(encoder, self_);
  auto next = ledger_.get<uint64_t>(view(sequence_key)).value_or(1);

  const auto origin = encoder.encode(std::tuple{chain_selector_, next, caller});
  const auto body = encoder.encode(message);
  auto message_id = courier::blake3::hasher{}
                        .update(view(origin))
                        .update(view(body))
                        .finalize();

  auto routed = routed_message_t{.message_id = message_id,
                                 .source_chain_selector = chain_selector_,
                                 .sender = caller,
                                 .message = message,
                                 .fee_paid = value_of(fee)};
  ledger_.put(view(key::make_router_outbox_key(encoder, self_, next)), routed);
  ledger_.put(view(sequence_key), next + 1);

  spdlog::debug("Router {} accepted message {} for chain {} (fee {})",
                to_hex(self_), to_hex(message_id), destination_selector,
                to_string(value_of(fee)));
  return message_id;
}

std::vector<routed_message_t> local_router::outbox() const {
  auto& encoder = ledger_.encoder();
  auto prefix = key::make_router_outbox_prefix_key(encoder, self_);
  auto ordered = std::map<uint64_t, routed_message_t>{};
  for (const auto& [key, value] : ledger_.list_by_prefix(view(prefix))) {
    auto sequence =
        key::parse_sequenced_key(encoder, view(key), key::kRouterOutboxKeyPrefix);
    if (!sequence.has_value()) {
      continue;
    }
    ordered.emplace(*sequence, encoder.decode<routed_message_t>(view(value)));
  }

  auto out = std::vector<routed_message_t>{};
  out.reserve(ordered.size());
  for (auto& [sequence, routed] : ordered) {
    out.push_back(std::move(routed));
  }
  return out;
}

std::optional<routed_message_t> local_router::find(
    const message_id_t& message_id) const {
  for (auto& routed : outbox()) {
    if (routed.message_id == message_id) {
      return routed;
    }
  }
  return std::nullopt;
}

bool local_router::delivered(const message_id_t& message_id) const {
  return ledger_.contains(
      view(key::make_router_delivered_key(ledger_.encoder(), self_, message_id)));
}

void local_router::mark_delivered(const message_id_t& message_id) {
  ledger_.put(
      view(key::make_router_delivered_key(ledger_.encoder(), self_, message_id)),
      true);
}

}  // namespace courier::chain
