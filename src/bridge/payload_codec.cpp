#include <spdlog/spdlog.h>
#include <algorithm>
#include <courier/bridge/payload_codec.hpp>
#include <iterator>

using namespace courier::schema;

namespace courier::bridge {

bytes_t payload_codec::encode(const transfer_intent_t& intent) const {
  return encoder_.encode(intent);
}

outcome_t<transfer_intent_t> payload_codec::decode(
    const bytes_view_t& payload) const {
  if (payload.empty()) {
    return make_error(bridge_error_code::malformed_payload, "empty payload");
  }

  auto decoded = encoder_.try_decode<transfer_intent_t>(payload);
  if (!decoded.has_value()) {
    spdlog::debug("Payload of {} byte(s) failed to decode", payload.size());
    return make_error(bridge_error_code::malformed_payload,
                      "payload is not a transfer intent");
  }
  if (decoded->version != 1) {
    return make_error(bridge_error_code::malformed_payload,
                      "unsupported transfer intent version " +
                          std::to_string(decoded->version));
  }

  // Re-encoding must reproduce the input exactly; this rejects trailing
  // bytes and non-canonical length prefixes.
  auto canonical = encoder_.encode(*decoded);
  if (!std::equal(std::begin(canonical), std::end(canonical),
                  std::begin(payload), std::end(payload))) {
    return make_error(bridge_error_code::malformed_payload,
                      "payload is not canonically encoded");
  }
  return *decoded;
}

}  // namespace courier::bridge
