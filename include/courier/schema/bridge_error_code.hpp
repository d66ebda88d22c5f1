#pragma once

#include <courier/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: bridge error code.
// Bridge workflow: stable numeric failure kinds surfaced by every entry point
// so off-chain tooling can react (top up fees, fix ownership, resubmit).
namespace courier::schema {

enum class bridge_error_code : uint32_t {
  malformed_payload = 1,
  not_token_owner = 2,
  custody_transition_failed = 3,
  insufficient_fee = 4,
  relay_unavailable = 5,
  unsupported_destination = 6,
  unauthorized_sender = 7,
  duplicate_token_id = 8,
  unauthorized_caller = 9,
  message_already_processed = 10,
  nothing_to_withdraw = 11,
  invalid_configuration = 12,
  token_missing = 13,
  transfer_not_authorized = 14,
  insufficient_balance = 15,
  insufficient_allowance = 16,
  invalid_recipient = 17,
  fee_approval_rejected = 18,
};

inline constexpr auto kBridgeErrorCodeMappings = std::array{
    std::pair<std::string_view, bridge_error_code>{
        "malformed_payload", bridge_error_code::malformed_payload},
    std::pair<std::string_view, bridge_error_code>{
        "not_token_owner", bridge_error_code::not_token_owner},
    std::pair<std::string_view, bridge_error_code>{
        "custody_transition_failed",
        bridge_error_code::custody_transition_failed},
    std::pair<std::string_view, bridge_error_code>{
        "insufficient_fee", bridge_error_code::insufficient_fee},
    std::pair<std::string_view, bridge_error_code>{
        "relay_unavailable", bridge_error_code::relay_unavailable},
    std::pair<std::string_view, bridge_error_code>{
        "unsupported_destination", bridge_error_code::unsupported_destination},
    std::pair<std::string_view, bridge_error_code>{
        "unauthorized_sender", bridge_error_code::unauthorized_sender},
    std::pair<std::string_view, bridge_error_code>{
        "duplicate_token_id", bridge_error_code::duplicate_token_id},
    std::pair<std::string_view, bridge_error_code>{
        "unauthorized_caller", bridge_error_code::unauthorized_caller},
    std::pair<std::string_view, bridge_error_code>{
        "message_already_processed",
        bridge_error_code::message_already_processed},
    std::pair<std::string_view, bridge_error_code>{
        "nothing_to_withdraw", bridge_error_code::nothing_to_withdraw},
    std::pair<std::string_view, bridge_error_code>{
        "invalid_configuration", bridge_error_code::invalid_configuration},
    std::pair<std::string_view, bridge_error_code>{
        "token_missing", bridge_error_code::token_missing},
    std::pair<std::string_view, bridge_error_code>{
        "transfer_not_authorized", bridge_error_code::transfer_not_authorized},
    std::pair<std::string_view, bridge_error_code>{
        "insufficient_balance", bridge_error_code::insufficient_balance},
    std::pair<std::string_view, bridge_error_code>{
        "insufficient_allowance", bridge_error_code::insufficient_allowance},
    std::pair<std::string_view, bridge_error_code>{
        "invalid_recipient", bridge_error_code::invalid_recipient},
    std::pair<std::string_view, bridge_error_code>{
        "fee_approval_rejected", bridge_error_code::fee_approval_rejected},
};

template <>
inline std::optional<bridge_error_code> try_from_string<bridge_error_code>(
    const std::string_view value) {
  return from_string(value, kBridgeErrorCodeMappings);
}

inline constexpr std::string_view to_string(const bridge_error_code value) {
  return to_string(value, kBridgeErrorCodeMappings).value_or("unknown");
}

}  // namespace courier::schema
