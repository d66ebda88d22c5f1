#pragma once

#include <courier/schema/bridge_error.hpp>
#include <courier/schema/outbound_message.hpp>
#include <courier/schema/primitives.hpp>
#include <optional>

// Contracts the bridge calls but does not implement. `caller` is the account
// performing the call on the host chain (the bridge itself for every call the
// bridge makes). Failures are reported as bridge_error_t and propagated by the
// calling component.
//
// Implementations run while the calling bridge holds its entry-point lock
// and must not re-enter that bridge.
namespace courier::bridge {

/// ERC-721-style token collection the bridge moves and mints.
class wrapped_token {
 public:
  virtual ~wrapped_token() = default;

  virtual const courier::schema::address_t& address() const = 0;

  /// Current owner, or std::nullopt when the id does not exist.
  virtual std::optional<courier::schema::address_t> owner_of(
      const courier::schema::token_id_t& token_id) const = 0;

  virtual courier::schema::status_t transfer_from(
      const courier::schema::address_t& caller,
      const courier::schema::address_t& from,
      const courier::schema::address_t& to,
      const courier::schema::token_id_t& token_id) = 0;

  virtual courier::schema::status_t burn(
      const courier::schema::address_t& caller,
      const courier::schema::token_id_t& token_id) = 0;

  /// Fails with duplicate_token_id when the id already exists.
  virtual courier::schema::status_t mint_with_specific_id(
      const courier::schema::address_t& caller,
      const courier::schema::address_t& owner,
      const courier::schema::token_id_t& token_id) = 0;
};

/// Fungible asset used to pay relay fees.
class fee_asset {
 public:
  virtual ~fee_asset() = default;

  virtual const courier::schema::address_t& address() const = 0;

  virtual courier::schema::amount_t balance_of(
      const courier::schema::address_t& holder) const = 0;

  /// Set (not increase) the amount `spender` may pull from `caller`.
  virtual bool approve(const courier::schema::address_t& caller,
                       const courier::schema::address_t& spender,
                       const courier::schema::amount_t& amount) = 0;

  virtual courier::schema::status_t transfer(
      const courier::schema::address_t& caller,
      const courier::schema::address_t& to,
      const courier::schema::amount_t& amount) = 0;
};

/// Entry contract of the message-relay network on the local chain.
class relay_router {
 public:
  virtual ~relay_router() = default;

  /// Account the relay uses when it delivers inbound messages.
  virtual const courier::schema::address_t& address() const = 0;

  /// Fails with relay_unavailable or unsupported_destination.
  virtual courier::schema::outcome_t<courier::schema::amount_t> get_fee(
      courier::schema::chain_selector_t destination_selector,
      const courier::schema::outbound_message_t& message) const = 0;

  /// Collects the fee from `caller` (which must have approved it) and accepts
  /// the message. Delivery to the destination happens later, never from
  /// inside this call.
  virtual courier::schema::outcome_t<courier::schema::message_id_t> send(
      const courier::schema::address_t& caller,
      courier::schema::chain_selector_t destination_selector,
      const courier::schema::outbound_message_t& message) = 0;
};

}  // namespace courier::bridge
