#include <courier/schema/encoding/scale/outbound_message.hpp>
#include <courier/schema/encoding/scale/routed_message.hpp>

using namespace courier::schema;

namespace courier::schema::encoding::scale {

void encode(routed_message<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.message_id, encoder);
  encode(o.source_chain_selector, encoder);
  encode(o.sender, encoder);
  encode(o.message, encoder);
  encode(o.fee_paid, encoder);
}

void decode(routed_message<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.message_id, decoder);
  decode(o.source_chain_selector, decoder);
  decode(o.sender, decoder);
  decode(o.message, decoder);
  decode(o.fee_paid, decoder);
}

}  // namespace courier::schema::encoding::scale
