#pragma once

#include <courier/bridge/collaborators.hpp>
#include <courier/schema/bridge_error.hpp>
#include <courier/schema/mint_policy.hpp>
#include <courier/schema/primitives.hpp>

namespace courier::bridge {

/// Local custody transitions that must succeed before anything is sent.
///
/// The bridge holds a token only between transfer-in and burn, both inside
/// the caller's ledger transaction. A failure in either step leaves the
/// transaction to be rolled back by the entry point.
class custody_manager final {
 public:
  custody_manager(wrapped_token& token,
                  const courier::schema::address_t& bridge_address,
                  const courier::schema::address_t& owner,
                  courier::schema::mint_policy policy);

  /// requester → bridge → burned. not_token_owner when `requester` does not
  /// own `token_id` (or it does not exist); custody_transition_failed when the
  /// token contract rejects either step.
  courier::schema::status_t lock_and_burn(
      const courier::schema::token_id_t& token_id,
      const courier::schema::address_t& requester);

  /// Origination needs no custody, only the configured policy.
  courier::schema::status_t authorize_origination(
      const courier::schema::address_t& caller) const;

 private:
  wrapped_token& token_;
  courier::schema::address_t bridge_address_;
  courier::schema::address_t owner_;
  courier::schema::mint_policy policy_;
};

}  // namespace courier::bridge
