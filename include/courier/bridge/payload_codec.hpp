#pragma once

#include <courier/schema/bridge_error.hpp>
#include <courier/schema/encoding/scale/encoder.hpp>
#include <courier/schema/primitives.hpp>
#include <courier/schema/transfer_intent.hpp>

namespace courier::bridge {

/// Converts transfer intents to and from the opaque relay payload.
///
/// Decoding is total over attacker-controlled bytes: anything other than the
/// canonical encoding of a supported intent version is malformed_payload.
class payload_codec final {
 public:
  courier::schema::bytes_t encode(
      const courier::schema::transfer_intent_t& intent) const;

  courier::schema::outcome_t<courier::schema::transfer_intent_t> decode(
      const courier::schema::bytes_view_t& payload) const;

 private:
  mutable courier::schema::encoding::encoder<
      courier::schema::encoding::scale_encoder_tag>
      encoder_;
};

}  // namespace courier::bridge
