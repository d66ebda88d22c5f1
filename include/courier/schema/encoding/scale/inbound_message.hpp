#pragma once

#include <courier/schema/inbound_message.hpp>
#include <scale/scale.hpp>

namespace courier::schema::encoding::scale {

void encode(courier::schema::inbound_message<1>&& o, ::scale::Encoder& encoder);
void decode(courier::schema::inbound_message<1>&& o, ::scale::Decoder& decoder);

}  // namespace courier::schema::encoding::scale
