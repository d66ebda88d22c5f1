#include <courier/schema/encoding/scale/transfer_intent.hpp>

using namespace courier::schema;

namespace courier::schema::encoding::scale {

void encode(transfer_intent<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.token_id, encoder);
  encode(o.new_owner, encoder);
}

void decode(transfer_intent<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.token_id, decoder);
  decode(o.new_owner, decoder);
}

}  // namespace courier::schema::encoding::scale
