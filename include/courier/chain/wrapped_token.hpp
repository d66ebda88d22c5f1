#pragma once

#include <courier/bridge/collaborators.hpp>
#include <courier/ledger/state.hpp>
#include <courier/schema/bridge_error.hpp>
#include <courier/schema/primitives.hpp>
#include <optional>

namespace courier::chain {

/// Ledger-backed ERC-721 style collection.
///
/// Ownership, per-token approvals and operator approvals live in the host
/// ledger under keys scoped by the contract address. Only `minter` may mint.
class wrapped_token final : public courier::bridge::wrapped_token {
 public:
  wrapped_token(courier::ledger::state& ledger,
                const courier::schema::address_t& self,
                const courier::schema::address_t& minter);

  const courier::schema::address_t& address() const override;

  std::optional<courier::schema::address_t> owner_of(
      const courier::schema::token_id_t& token_id) const override;

  /// Caller must be the owner, the approved account or an operator of the
  /// owner. Clears the per-token approval.
  courier::schema::status_t transfer_from(
      const courier::schema::address_t& caller,
      const courier::schema::address_t& from,
      const courier::schema::address_t& to,
      const courier::schema::token_id_t& token_id) override;

  /// Caller must own the token.
  courier::schema::status_t burn(
      const courier::schema::address_t& caller,
      const courier::schema::token_id_t& token_id) override;

  courier::schema::status_t mint_with_specific_id(
      const courier::schema::address_t& caller,
      const courier::schema::address_t& owner,
      const courier::schema::token_id_t& token_id) override;

  courier::schema::status_t approve(
      const courier::schema::address_t& caller,
      const courier::schema::address_t& approved,
      const courier::schema::token_id_t& token_id);

  void set_approval_for_all(const courier::schema::address_t& caller,
                            const courier::schema::address_t& op,
                            bool approved);

  std::optional<courier::schema::address_t> get_approved(
      const courier::schema::token_id_t& token_id) const;

  bool is_approved_for_all(const courier::schema::address_t& owner,
                           const courier::schema::address_t& op) const;

  const courier::schema::address_t& minter() const;

 private:
  courier::schema::bytes_t owner_key(
      const courier::schema::token_id_t& token_id) const;
  courier::schema::bytes_t approval_key(
      const courier::schema::token_id_t& token_id) const;
  courier::schema::bytes_t operator_key(
      const courier::schema::address_t& owner,
      const courier::schema::address_t& op) const;

  courier::ledger::state& ledger_;
  courier::schema::address_t self_;
  courier::schema::address_t minter_;
};

}  // namespace courier::chain
