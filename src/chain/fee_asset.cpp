#include <spdlog/spdlog.h>
#include <courier/chain/fee_asset.hpp>
#include <courier/schema/key/ledger_keys.hpp>

using namespace courier::schema;

namespace {

bytes_view_t view(const bytes_t& key) {
  return bytes_view_t{key.data(), key.size()};
}

}  // namespace

namespace courier::chain {

fee_asset::fee_asset(courier::ledger::state& ledger, const address_t& self)
    : ledger_{ledger}, self_{self} {}

const address_t& fee_asset::address() const {
  return self_;
}

amount_t fee_asset::balance_of(const address_t& holder) const {
  auto key = key::make_fee_balance_key(ledger_.encoder(), self_, holder);
  return ledger_.get<amount_t>(view(key)).value_or(amount_t{0});
}

amount_t fee_asset::allowance(const address_t& owner,
                              const address_t& spender) const {
  auto key =
      key::make_fee_allowance_key(ledger_.encoder(), self_, owner, spender);
  return ledger_.get<amount_t>(view(key)).value_or(amount_t{0});
}

bool fee_asset::approve(const address_t& caller,
                        const address_t& spender,
                        const amount_t& amount) {
  if (is_zero(spender)) {
    return false;
  }
  auto key =
      key::make_fee_allowance_key(ledger_.encoder(), self_, caller, spender);
  if (amount == 0) {
    ledger_.erase(view(key));
  } else {
    ledger_.put(view(key), amount);
  }
  spdlog::debug("Allowance {} -> {} set to {}", to_hex(caller), to_hex(spender),
                to_string(amount));
  return true;
}

status_t fee_asset::transfer(const address_t& caller,
                             const address_t& to,
                             const amount_t& amount) {
  return move(caller, to, amount);
}

status_t fee_asset::transfer_from(const address_t& caller,
                                  const address_t& from,
                                  const address_t& to,
                                  const amount_t& amount) {
  auto allowed = allowance(from, caller);
  if (allowed < amount) {
    return make_shortfall_error(bridge_error_code::insufficient_allowance,
                                to_hex(caller) + " allowance from " +
                                    to_hex(from) + " too low",
                                allowed, amount);
  }
  auto moved = move(from, to, amount);
  if (!succeeded(moved)) {
    return moved;
  }
  auto key = key::make_fee_allowance_key(ledger_.encoder(), self_, from, caller);
  auto remaining = allowed - amount;
  if (remaining == 0) {
    ledger_.erase(view(key));
  } else {
    ledger_.put(view(key), remaining);
  }
  return ok_t{};
}

void fee_asset::mint(const address_t& to, const amount_t& amount) {
  set_balance(to, balance_of(to) + amount);
}

status_t fee_asset::move(const address_t& from,
                         const address_t& to,
                         const amount_t& amount) {
  if (is_zero(to)) {
    return make_error(bridge_error_code::transfer_not_authorized,
                      "transfer to the zero address");
  }
  auto available = balance_of(from);
  if (available < amount) {
    return make_shortfall_error(bridge_error_code::insufficient_balance,
                                to_hex(from) + " balance too low", available,
                                amount);
  }
  if (from == to) {
    return ok_t{};
  }
  set_balance(from, available - amount);
  set_balance(to, balance_of(to) + amount);
  spdlog::debug("Fee token moved {} from {} to {}", to_string(amount),
                to_hex(from), to_hex(to));
  return ok_t{};
}

void fee_asset::set_balance(const address_t& holder, const amount_t& amount) {
  auto key = key::make_fee_balance_key(ledger_.encoder(), self_, holder);
  if (amount == 0) {
    ledger_.erase(view(key));
  } else {
    ledger_.put(view(key), amount);
  }
}

}  // namespace courier::chain
