#include <spdlog/spdlog.h>
#include <courier/chain/wrapped_token.hpp>
#include <courier/schema/key/ledger_keys.hpp>

using namespace courier::schema;

namespace {

bytes_view_t view(const bytes_t& key) {
  return bytes_view_t{key.data(), key.size()};
}

}  // namespace

namespace courier::chain {

wrapped_token::wrapped_token(courier::ledger::state& ledger,
                             const address_t& self,
                             const address_t& minter)
    : ledger_{ledger}, self_{self}, minter_{minter} {}

const address_t& wrapped_token::address() const {
  return self_;
}

const address_t& wrapped_token::minter() const {
  return minter_;
}

std::optional<address_t> wrapped_token::owner_of(
    const token_id_t& token_id) const {
  return ledger_.get<address_t>(view(owner_key(token_id)));
}

std::optional<address_t> wrapped_token::get_approved(
    const token_id_t& token_id) const {
  return ledger_.get<address_t>(view(approval_key(token_id)));
}

bool wrapped_token::is_approved_for_all(const address_t& owner,
                                        const address_t& op) const {
  return ledger_.get<bool>(view(operator_key(owner, op))).value_or(false);
}

status_t wrapped_token::transfer_from(const address_t& caller,
                                      const address_t& from,
                                      const address_t& to,
                                      const token_id_t& token_id) {
  auto owner = owner_of(token_id);
  if (!owner.has_value()) {
    return make_error(bridge_error_code::token_missing,
                      "token " + to_string(token_id) + " does not exist");
  }
  if (*owner != from) {
    return make_error(bridge_error_code::transfer_not_authorized,
                      to_hex(from) + " does not own token " +
                          to_string(token_id));
  }
  if (is_zero(to)) {
    return make_error(bridge_error_code::transfer_not_authorized,
                      "transfer to the zero address");
  }
  auto approved = get_approved(token_id);
  if (caller != *owner &&
      !(approved.has_value() && *approved == caller) &&
      !is_approved_for_all(*owner, caller)) {
    return make_error(bridge_error_code::transfer_not_authorized,
                      to_hex(caller) + " may not move token " +
                          to_string(token_id));
  }

  ledger_.erase(view(approval_key(token_id)));
  ledger_.put(view(owner_key(token_id)), to);
  spdlog::debug("Token {} transferred {} -> {}", to_string(token_id),
                to_hex(from), to_hex(to));
  return ok_t{};
}

status_t wrapped_token::burn(const address_t& caller,
                             const token_id_t& token_id) {
  auto owner = owner_of(token_id);
  if (!owner.has_value()) {
    return make_error(bridge_error_code::token_missing,
                      "token " + to_string(token_id) + " does not exist");
  }
  if (*owner != caller) {
    return make_error(bridge_error_code::transfer_not_authorized,
                      to_hex(caller) + " may not burn token " +
                          to_string(token_id));
  }
  ledger_.erase(view(approval_key(token_id)));
  ledger_.erase(view(owner_key(token_id)));
  spdlog::debug("Token {} burned by {}", to_string(token_id), to_hex(caller));
  return ok_t{};
}

status_t wrapped_token::mint_with_specific_id(const address_t& caller,
                                              const address_t& owner,
                                              const token_id_t& token_id) {
  if (caller != minter_) {
    return make_error(bridge_error_code::unauthorized_caller,
                      to_hex(caller) + " is not the minter");
  }
  if (is_zero(owner)) {
    return make_error(bridge_error_code::transfer_not_authorized,
                      "mint to the zero address");
  }
  auto key = owner_key(token_id);
  if (ledger_.contains(view(key))) {
    return make_error(bridge_error_code::duplicate_token_id,
                      "token " + to_string(token_id) + " already exists");
  }
  ledger_.put(view(key), owner);
  spdlog::debug("Token {} minted to {}", to_string(token_id), to_hex(owner));
  return ok_t{};
}

status_t wrapped_token::approve(const address_t& caller,
                                const address_t& approved,
                                const token_id_t& token_id) {
  auto owner = owner_of(token_id);
  if (!owner.has_value()) {
    return make_error(bridge_error_code::token_missing,
                      "token " + to_string(token_id) + " does not exist");
  }
  if (caller != *owner && !is_approved_for_all(*owner, caller)) {
    return make_error(bridge_error_code::transfer_not_authorized,
                      to_hex(caller) + " may not approve token " +
                          to_string(token_id));
  }
  if (is_zero(approved)) {
    ledger_.erase(view(approval_key(token_id)));
  } else {
    ledger_.put(view(approval_key(token_id)), approved);
  }
  return ok_t{};
}

void wrapped_token::set_approval_for_all(const address_t& caller,
                                         const address_t& op,
                                         const bool approved) {
  auto key = operator_key(caller, op);
  if (approved) {
    ledger_.put(view(key), true);
  } else {
    ledger_.erase(view(key));
  }
}

bytes_t wrapped_token::owner_key(const token_id_t& token_id) const {
  return key::make_token_owner_key(ledger_.encoder(), self_, token_id);
}

bytes_t wrapped_token::approval_key(const token_id_t& token_id) const {
  return key::make_token_approval_key(ledger_.encoder(), self_, token_id);
}

bytes_t wrapped_token::operator_key(const address_t& owner,
                                    const address_t& op) const {
  return key::make_token_operator_key(ledger_.encoder(), self_, owner, op);
}

}  // namespace courier::chain
