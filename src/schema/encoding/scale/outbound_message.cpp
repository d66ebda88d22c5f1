#include <courier/schema/encoding/scale/outbound_message.hpp>

using namespace courier::schema;

namespace courier::schema::encoding::scale {

void encode(outbound_message<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.destination_selector, encoder);
  encode(o.receiver, encoder);
  encode(o.payload, encoder);
  encode(o.fee_token, encoder);
  encode(o.gas_limit, encoder);
}

void decode(outbound_message<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.destination_selector, decoder);
  decode(o.receiver, decoder);
  decode(o.payload, decoder);
  decode(o.fee_token, decoder);
  decode(o.gas_limit, decoder);
}

}  // namespace courier::schema::encoding::scale
