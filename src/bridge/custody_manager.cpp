#include <spdlog/spdlog.h>
#include <courier/bridge/custody_manager.hpp>

using namespace courier::schema;

namespace courier::bridge {

custody_manager::custody_manager(wrapped_token& token,
                                 const address_t& bridge_address,
                                 const address_t& owner,
                                 const mint_policy policy)
    : token_{token},
      bridge_address_{bridge_address},
      owner_{owner},
      policy_{policy} {}

status_t custody_manager::lock_and_burn(const token_id_t& token_id,
                                        const address_t& requester) {
  auto owner = token_.owner_of(token_id);
  if (!owner.has_value() || *owner != requester) {
    return make_error(bridge_error_code::not_token_owner,
                      to_hex(requester) + " does not own token " +
                          to_string(token_id));
  }

  auto transferred =
      token_.transfer_from(bridge_address_, requester, bridge_address_,
                           token_id);
  if (!succeeded(transferred)) {
    spdlog::warn("Transfer-in of token {} rejected: {}", to_string(token_id),
                 error_of(transferred).message);
    return make_error(bridge_error_code::custody_transition_failed,
                      "transfer to bridge failed: " +
                          error_of(transferred).message);
  }

  auto burned = token_.burn(bridge_address_, token_id);
  if (!succeeded(burned)) {
    spdlog::warn("Burn of token {} rejected: {}", to_string(token_id),
                 error_of(burned).message);
    return make_error(bridge_error_code::custody_transition_failed,
                      "burn failed: " + error_of(burned).message);
  }

  spdlog::debug("Token {} moved from {} into bridge custody and burned",
                to_string(token_id), to_hex(requester));
  return ok_t{};
}

status_t custody_manager::authorize_origination(const address_t& caller) const {
  switch (policy_) {
    case mint_policy::open:
      return ok_t{};
    case mint_policy::owner_only:
      if (caller == owner_) {
        return ok_t{};
      }
      return make_error(bridge_error_code::unauthorized_caller,
                        to_hex(caller) + " may not originate mints");
  }
  return make_error(bridge_error_code::invalid_configuration,
                    "unknown mint policy");
}

}  // namespace courier::bridge
