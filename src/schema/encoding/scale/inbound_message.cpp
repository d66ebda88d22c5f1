#include <courier/schema/encoding/scale/inbound_message.hpp>

using namespace courier::schema;

namespace courier::schema::encoding::scale {

void encode(inbound_message<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.message_id, encoder);
  encode(o.source_chain_selector, encoder);
  encode(o.source_sender, encoder);
  encode(o.payload, encoder);
}

void decode(inbound_message<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.message_id, decoder);
  decode(o.source_chain_selector, decoder);
  decode(o.source_sender, decoder);
  decode(o.payload, decoder);
}

}  // namespace courier::schema::encoding::scale
