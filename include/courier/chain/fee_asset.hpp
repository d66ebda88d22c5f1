#pragma once

#include <courier/bridge/collaborators.hpp>
#include <courier/ledger/state.hpp>
#include <courier/schema/bridge_error.hpp>
#include <courier/schema/primitives.hpp>

namespace courier::chain {

/// Ledger-backed fungible token used to pay relay fees.
class fee_asset final : public courier::bridge::fee_asset {
 public:
  fee_asset(courier::ledger::state& ledger,
            const courier::schema::address_t& self);

  const courier::schema::address_t& address() const override;

  courier::schema::amount_t balance_of(
      const courier::schema::address_t& holder) const override;

  courier::schema::amount_t allowance(
      const courier::schema::address_t& owner,
      const courier::schema::address_t& spender) const;

  /// Overwrites the allowance. Rejects the zero spender.
  bool approve(const courier::schema::address_t& caller,
               const courier::schema::address_t& spender,
               const courier::schema::amount_t& amount) override;

  courier::schema::status_t transfer(
      const courier::schema::address_t& caller,
      const courier::schema::address_t& to,
      const courier::schema::amount_t& amount) override;

  /// Moves `amount` from `from` to `to` on behalf of `caller`, consuming
  /// the allowance `from` granted to `caller`.
  courier::schema::status_t transfer_from(
      const courier::schema::address_t& caller,
      const courier::schema::address_t& from,
      const courier::schema::address_t& to,
      const courier::schema::amount_t& amount);

  void mint(const courier::schema::address_t& to,
            const courier::schema::amount_t& amount);

 private:
  courier::schema::status_t move(const courier::schema::address_t& from,
                                 const courier::schema::address_t& to,
                                 const courier::schema::amount_t& amount);
  void set_balance(const courier::schema::address_t& holder,
                   const courier::schema::amount_t& amount);

  courier::ledger::state& ledger_;
  courier::schema::address_t self_;
};

}  // namespace courier::chain
