#pragma once

#include <courier/schema/message_receipt.hpp>
#include <scale/scale.hpp>

namespace courier::schema::encoding::scale {

void encode(courier::schema::message_receipt<1>&& o, ::scale::Encoder& encoder);
void decode(courier::schema::message_receipt<1>&& o, ::scale::Decoder& decoder);

}  // namespace courier::schema::encoding::scale
