#include <courier/schema/encoding/scale/message_receipt.hpp>

using namespace courier::schema;

namespace courier::schema::encoding::scale {

void encode(message_receipt<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.message_id, encoder);
  encode(o.destination_selector, encoder);
  encode(o.receiver, encoder);
  encode(o.fee_token, encoder);
  encode(o.fee_paid, encoder);
}

void decode(message_receipt<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.message_id, decoder);
  decode(o.destination_selector, decoder);
  decode(o.receiver, decoder);
  decode(o.fee_token, decoder);
  decode(o.fee_paid, decoder);
}

}  // namespace courier::schema::encoding::scale
