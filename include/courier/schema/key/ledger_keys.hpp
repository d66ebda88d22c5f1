#pragma once

#include <courier/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string_view>
#include <tuple>

// Schema key type: ledger keys.
// Bridge workflow: canonical key prefixes and key codecs for token custody,
// fee balances, router outboxes, bridge bookkeeping and the event log. Every
// collaborator key is scoped by the owning contract address so several
// contracts can share one host ledger.
namespace courier::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kTokenOwnerKeyPrefix{
    "SYS|STATE|TOKEN_OWNER|"};
inline constexpr std::string_view kTokenApprovalKeyPrefix{
    "SYS|STATE|TOKEN_APPROVAL|"};
inline constexpr std::string_view kTokenOperatorKeyPrefix{
    "SYS|STATE|TOKEN_OPERATOR|"};
inline constexpr std::string_view kFeeBalanceKeyPrefix{
    "SYS|STATE|FEE_BALANCE|"};
inline constexpr std::string_view kFeeAllowanceKeyPrefix{
    "SYS|STATE|FEE_ALLOWANCE|"};
inline constexpr std::string_view kRouterSequenceKeyPrefix{
    "SYS|STATE|ROUTER_SEQ|"};
inline constexpr std::string_view kRouterOutboxKeyPrefix{
    "SYS|STATE|ROUTER_OUTBOX|"};
inline constexpr std::string_view kRouterDeliveredKeyPrefix{
    "SYS|STATE|ROUTER_DELIVERED|"};
inline constexpr std::string_view kOriginationSequenceKeyPrefix{
    "SYS|STATE|BRIDGE_MINT_SEQ|"};
inline constexpr std::string_view kProcessedMessageKeyPrefix{
    "SYS|STATE|BRIDGE_PROCESSED|"};
inline constexpr std::string_view kReceiptSequenceKeyPrefix{
    "SYS|STATE|BRIDGE_RECEIPT_SEQ|"};
inline constexpr std::string_view kReceiptKeyPrefix{
    "SYS|STATE|BRIDGE_RECEIPT|"};
inline constexpr std::string_view kEventSeqKeyPrefix{"SYS|STATE|EVENT_SEQ|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

template <typename Encoder, typename T>
courier::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                           std::string_view prefix,
                                           const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
courier::schema::bytes_t make_token_owner_key(
    Encoder& encoder,
    const courier::schema::address_t& token_contract,
    const courier::schema::token_id_t& token_id) {
  return make_prefixed_key(encoder, kTokenOwnerKeyPrefix,
                           std::tuple{token_contract, token_id});
}

template <typename Encoder>
courier::schema::bytes_t make_token_approval_key(
    Encoder& encoder,
    const courier::schema::address_t& token_contract,
    const courier::schema::token_id_t& token_id) {
  return make_prefixed_key(encoder, kTokenApprovalKeyPrefix,
                           std::tuple{token_contract, token_id});
}

template <typename Encoder>
courier::schema::bytes_t make_token_operator_key(
    Encoder& encoder,
    const courier::schema::address_t& token_contract,
    const courier::schema::address_t& owner,
    const courier::schema::address_t& op) {
  return make_prefixed_key(encoder, kTokenOperatorKeyPrefix,
                           std::tuple{token_contract, owner, op});
}

template <typename Encoder>
courier::schema::bytes_t make_fee_balance_key(
    Encoder& encoder,
    const courier::schema::address_t& asset,
    const courier::schema::address_t& holder) {
  return make_prefixed_key(encoder, kFeeBalanceKeyPrefix,
                           std::tuple{asset, holder});
}

template <typename Encoder>
courier::schema::bytes_t make_fee_allowance_key(
    Encoder& encoder,
    const courier::schema::address_t& asset,
    const courier::schema::address_t& owner,
    const courier::schema::address_t& spender) {
  return make_prefixed_key(encoder, kFeeAllowanceKeyPrefix,
                           std::tuple{asset, owner, spender});
}

template <typename Encoder>
courier::schema::bytes_t make_router_sequence_key(
    Encoder& encoder,
    const courier::schema::address_t& router) {
  return make_prefixed_key(encoder, kRouterSequenceKeyPrefix, router);
}

template <typename Encoder>
courier::schema::bytes_t make_router_outbox_key(
    Encoder& encoder,
    const courier::schema::address_t& router,
    uint64_t sequence) {
  return make_prefixed_key(encoder, kRouterOutboxKeyPrefix,
                           std::tuple{router, sequence});
}

template <typename Encoder>
courier::schema::bytes_t make_router_outbox_prefix_key(
    Encoder& encoder,
    const courier::schema::address_t& router) {
  return make_prefixed_key(encoder, kRouterOutboxKeyPrefix, router);
}

template <typename Encoder>
courier::schema::bytes_t make_router_delivered_key(
    Encoder& encoder,
    const courier::schema::address_t& router,
    const courier::schema::message_id_t& message_id) {
  return make_prefixed_key(encoder, kRouterDeliveredKeyPrefix,
                           std::tuple{router, message_id});
}

template <typename Encoder>
courier::schema::bytes_t make_origination_sequence_key(
    Encoder& encoder,
    const courier::schema::address_t& bridge) {
  return make_prefixed_key(encoder, kOriginationSequenceKeyPrefix, bridge);
}

template <typename Encoder>
courier::schema::bytes_t make_processed_message_key(
    Encoder& encoder,
    const courier::schema::address_t& bridge,
    const courier::schema::message_id_t& message_id) {
  return make_prefixed_key(encoder, kProcessedMessageKeyPrefix,
                           std::tuple{bridge, message_id});
}

template <typename Encoder>
courier::schema::bytes_t make_receipt_sequence_key(
    Encoder& encoder,
    const courier::schema::address_t& bridge) {
  return make_prefixed_key(encoder, kReceiptSequenceKeyPrefix, bridge);
}

template <typename Encoder>
courier::schema::bytes_t make_receipt_key(
    Encoder& encoder,
    const courier::schema::address_t& bridge,
    uint64_t sequence) {
  return make_prefixed_key(encoder, kReceiptKeyPrefix,
                           std::tuple{bridge, sequence});
}

template <typename Encoder>
courier::schema::bytes_t make_receipt_prefix_key(
    Encoder& encoder,
    const courier::schema::address_t& bridge) {
  return make_prefixed_key(encoder, kReceiptKeyPrefix, bridge);
}

template <typename Encoder>
courier::schema::bytes_t make_event_sequence_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kEventSeqKeyPrefix,
                           std::string_view{"NEXT"});
}

template <typename Encoder>
courier::schema::bytes_t make_event_key(Encoder& encoder, uint64_t event_id) {
  return make_prefixed_key(encoder, kEventPrefix, event_id);
}

template <typename Encoder>
courier::schema::bytes_t make_event_prefix_key(Encoder& encoder) {
  return encoder.encode(kEventPrefix);
}

template <typename Encoder>
std::optional<uint64_t> parse_event_key(
    Encoder& encoder,
    const courier::schema::bytes_view_t& key) {
  auto decoded =
      encoder.template try_decode<std::tuple<std::string, uint64_t>>(key);
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  if (std::get<0>(decoded.value()) != kEventPrefix) {
    return std::nullopt;
  }
  return std::get<1>(decoded.value());
}

template <typename Encoder>
std::optional<uint64_t> parse_sequenced_key(
    Encoder& encoder,
    const courier::schema::bytes_view_t& key,
    const std::string_view prefix) {
  auto decoded = encoder.template try_decode<
      std::tuple<std::string, courier::schema::address_t, uint64_t>>(key);
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  if (std::get<0>(decoded.value()) != prefix) {
    return std::nullopt;
  }
  return std::get<2>(decoded.value());
}

}  // namespace courier::schema::key
