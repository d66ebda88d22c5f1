#include <spdlog/spdlog.h>
#include <courier/bridge/nft_bridge.hpp>
#include <courier/common/critical.hpp>
#include <courier/schema/key/ledger_keys.hpp>
#include <iterator>
#include <string>
#include <tuple>
#include <utility>

using namespace courier::schema;

namespace {

bytes_t message_id_bytes(const message_id_t& message_id) {
  return bytes_t{std::begin(message_id), std::end(message_id)};
}

// A burned token can only come back through a mint to a non-zero owner,
// delivered to a non-zero receiver on the destination chain.
status_t check_recipients(const address_t& new_owner,
                          const address_t& destination_receiver) {
  if (is_zero(new_owner)) {
    return make_error(bridge_error_code::invalid_recipient,
                      "new owner must not be the zero address");
  }
  if (is_zero(destination_receiver)) {
    return make_error(bridge_error_code::invalid_recipient,
                      "destination receiver must not be the zero address");
  }
  return ok_t{};
}

std::string describe(const bridge_error_t& error) {
  if (!error.current.has_value() || !error.required.has_value()) {
    return error.message;
  }
  return error.message + " (current " + to_string(*error.current) +
         ", required " + to_string(*error.required) + ")";
}

}  // namespace

namespace courier::bridge {

nft_bridge::nft_bridge(bridge_config config,
                       courier::ledger::state& ledger,
                       wrapped_token& token,
                       fee_asset& fees,
                       relay_router& router)
    : config_{std::move(config)},
      ledger_{ledger},
      token_{token},
      fees_{fees},
      router_{router},
      codec_{},
      builder_{router_},
      custody_{token_, config_.self_address, config_.owner,
               config_.origination_policy},
      dispatcher_{ledger_, builder_, router_, fees_, config_.self_address,
                  [this](const transaction_event_t& e) { emit(e); }},
      receiver_{ledger_,
                codec_,
                token_,
                config_.self_address,
                config_.router,
                [this](const transaction_event_t& e) { emit(e); }} {
  auto valid = validate_bridge_config(config_);
  if (!succeeded(valid)) {
    spdlog::error("Invalid bridge configuration: {}", error_of(valid).message);
    courier::common::critical("invalid bridge configuration");
  }
  if (router_.address() != config_.router) {
    courier::common::critical("injected router does not match configuration");
  }
  if (fees_.address() != config_.fee_token) {
    courier::common::critical(
        "injected fee token does not match configuration");
  }
  spdlog::info(
      "Bridge {} on chain {} ready: router {}, fee token {}, gas limit {}, "
      "mint policy {}",
      to_hex(config_.self_address), config_.chain_selector,
      to_hex(config_.router), to_hex(config_.fee_token), config_.gas_limit,
      to_string(config_.origination_policy));
}

template <typename Body>
transaction_result_t nft_bridge::run(const std::string_view codespace,
                                     Body&& body) {
  auto lock = std::scoped_lock{mutex_};
  emitted_.clear();

  auto result = transaction_result_t{};
  auto tx = ledger_.begin();
  outcome_t<bytes_t> outcome = body();
  if (!succeeded(outcome)) {
    const auto& error = error_of(outcome);
    result.code = static_cast<uint32_t>(error.code);
    result.log = std::string{to_string(error.code)};
    result.info = describe(error);
    result.codespace = std::string{codespace};
    if (error.current.has_value() && error.required.has_value()) {
      result.data = ledger_.encoder().encode(
          std::tuple{*error.current, *error.required});
    }
    emitted_.clear();
    spdlog::warn("{} aborted: {} ({})", codespace, result.log, result.info);
    return result;
  }

  result.data = std::move(value_of(outcome));
  result.height = tx.commit();
  result.events = std::move(emitted_);
  emitted_.clear();
  spdlog::info("{} committed at height {} with {} event(s)", codespace,
               result.height, result.events.size());
  return result;
}

transaction_result_t nft_bridge::originate_mint(
    const address_t& caller,
    const chain_selector_t destination_selector,
    const address_t& receiver) {
  return run("courier.originate_mint", [&]() -> outcome_t<bytes_t> {
    auto recipients = check_recipients(caller, receiver);
    if (!succeeded(recipients)) {
      return error_of(recipients);
    }
    auto authorized = custody_.authorize_origination(caller);
    if (!succeeded(authorized)) {
      return error_of(authorized);
    }
    auto intent = transfer_intent_t{.token_id = next_originated_token_id(),
                                    .new_owner = caller};
    auto receipt = send_intent(intent, destination_selector, receiver);
    if (!succeeded(receipt)) {
      return error_of(receipt);
    }
    return message_id_bytes(value_of(receipt).message_id);
  });
}

transaction_result_t nft_bridge::bridge_out(
    const address_t& caller,
    const token_id_t& token_id,
    const address_t& new_owner,
    const chain_selector_t destination_selector,
    const address_t& destination_receiver) {
  return run("courier.bridge_out", [&]() -> outcome_t<bytes_t> {
    auto recipients = check_recipients(new_owner, destination_receiver);
    if (!succeeded(recipients)) {
      return error_of(recipients);
    }
    auto custody = custody_.lock_and_burn(token_id, caller);
    if (!succeeded(custody)) {
      return error_of(custody);
    }
    auto intent = transfer_intent_t{.token_id = token_id,
                                    .new_owner = new_owner};
    auto receipt =
        send_intent(intent, destination_selector, destination_receiver);
    if (!succeeded(receipt)) {
      return error_of(receipt);
    }
    return message_id_bytes(value_of(receipt).message_id);
  });
}

transaction_result_t nft_bridge::receive(const address_t& caller,
                                         const inbound_message_t& message) {
  return run("courier.receive", [&]() -> outcome_t<bytes_t> {
    auto intent = receiver_.receive(caller, message);
    if (!succeeded(intent)) {
      return error_of(intent);
    }
    return message_id_bytes(message.message_id);
  });
}

transaction_result_t nft_bridge::withdraw_fees(const address_t& caller,
                                               const address_t& beneficiary) {
  return run("courier.withdraw_fees", [&]() -> outcome_t<bytes_t> {
    if (is_zero(config_.owner) || caller != config_.owner) {
      return make_error(bridge_error_code::unauthorized_caller,
                        to_hex(caller) + " is not the bridge owner");
    }
    auto balance = fees_.balance_of(config_.self_address);
    if (balance == 0) {
      return make_error(bridge_error_code::nothing_to_withdraw,
                        "bridge holds no fee tokens");
    }
    auto transferred = fees_.transfer(config_.self_address, beneficiary,
                                      balance);
    if (!succeeded(transferred)) {
      return error_of(transferred);
    }
    emit(make_fees_withdrawn_event(config_.fee_token, beneficiary, balance));
    return ledger_.encoder().encode(balance);
  });
}

std::vector<message_receipt_t> nft_bridge::sent_messages() const {
  auto lock = std::scoped_lock{mutex_};
  return dispatcher_.receipts();
}

bool nft_bridge::processed(const message_id_t& message_id) const {
  auto lock = std::scoped_lock{mutex_};
  return receiver_.processed(message_id);
}

const bridge_config& nft_bridge::config() const {
  return config_;
}

outcome_t<message_receipt_t> nft_bridge::send_intent(
    const transfer_intent_t& intent,
    const chain_selector_t destination_selector,
    const address_t& receiver) {
  auto message = builder_.build(destination_selector, receiver,
                                codec_.encode(intent), config_.gas_limit,
                                config_.fee_token);
  return dispatcher_.send(message);
}

token_id_t nft_bridge::next_originated_token_id() {
  auto& encoder = ledger_.encoder();
  auto sequence_key =
      key::make_origination_sequence_key(encoder, config_.self_address);
  auto sequence_view = bytes_view_t{sequence_key.data(), sequence_key.size()};
  auto next = ledger_.get<uint64_t>(sequence_view).value_or(1);
  ledger_.put(sequence_view, next + 1);
  return make_originated_token_id(config_.chain_selector, next);
}

void nft_bridge::emit(const transaction_event_t& event) {
  ledger_.emit(event);
  emitted_.push_back(event);
}

token_id_t make_originated_token_id(const chain_selector_t chain_selector,
                                    const uint64_t sequence) {
  return (token_id_t{chain_selector} << 192) | token_id_t{sequence};
}

}  // namespace courier::bridge
