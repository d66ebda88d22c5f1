#include <spdlog/spdlog.h>
#include <courier/chain/relay_network.hpp>
#include <courier/common/critical.hpp>
#include <courier/schema/inbound_message.hpp>

using namespace courier::schema;

namespace courier::chain {

void relay_network::register_host(courier::ledger::state& ledger,
                                  local_router& router) {
  auto& host = hosts_[router.chain_selector()];
  host.ledger = &ledger;
  host.router = &router;
  spdlog::info("Relay registered chain {} with router {}",
               router.chain_selector(), to_hex(router.address()));
}

void relay_network::register_receiver(const chain_selector_t chain_selector,
                                      const address_t& receiver,
                                      courier::bridge::nft_bridge& bridge) {
  auto it = hosts_.find(chain_selector);
  if (it == std::end(hosts_)) {
    courier::common::critical("receiver registered on an unknown chain");
  }
  it->second.receivers.insert_or_assign(receiver, &bridge);
}

std::vector<delivery_t> relay_network::deliver() {
  auto out = std::vector<delivery_t>{};
  for (auto& [selector, host] : hosts_) {
    for (const auto& routed : host.router->outbox()) {
      if (host.router->delivered(routed.message_id)) {
        continue;
      }
      auto delivery = deliver_one(host, routed);
      if (delivery.has_value()) {
        out.push_back(std::move(*delivery));
      }
    }
  }
  return out;
}

std::optional<delivery_t> relay_network::redeliver(
    const message_id_t& message_id) {
  for (auto& [selector, host] : hosts_) {
    auto routed = host.router->find(message_id);
    if (routed.has_value()) {
      spdlog::info("Relay replaying message {}", to_hex(message_id));
      return deliver_one(host, *routed);
    }
  }
  spdlog::warn("Relay has no record of message {}", to_hex(message_id));
  return std::nullopt;
}

std::optional<delivery_t> relay_network::deliver_one(
    host_t& source,
    const routed_message_t& routed) {
  const auto destination_selector = routed.message.destination_selector;
  auto destination = hosts_.find(destination_selector);
  if (destination == std::end(hosts_)) {
    spdlog::warn("Message {} targets unknown chain {}",
                 to_hex(routed.message_id), destination_selector);
    return std::nullopt;
  }
  auto receiver = destination->second.receivers.find(routed.message.receiver);
  if (receiver == std::end(destination->second.receivers)) {
    spdlog::warn("Message {} targets unknown receiver {} on chain {}",
                 to_hex(routed.message_id), to_hex(routed.message.receiver),
                 destination_selector);
    return std::nullopt;
  }

  auto inbound = inbound_message_t{
      .message_id = routed.message_id,
      .source_chain_selector = routed.source_chain_selector,
      .source_sender = routed.sender,
      .payload = routed.message.payload};
  auto result = receiver->second->receive(
      destination->second.router->address(), inbound);

  // The attempt is recorded whatever the receiver answered; the relay does
  // not retry rejected messages on its own.
  {
    auto tx = source.ledger->begin();
    source.router->mark_delivered(routed.message_id);
    tx.commit();
  }

  spdlog::debug("Relayed message {} from chain {} to chain {}: code {}",
                to_hex(routed.message_id), routed.source_chain_selector,
                destination_selector, result.code);
  return delivery_t{.message_id = routed.message_id,
                    .source_chain_selector = routed.source_chain_selector,
                    .destination_selector = destination_selector,
                    .result = std::move(result)};
}

}  // namespace courier::chain
