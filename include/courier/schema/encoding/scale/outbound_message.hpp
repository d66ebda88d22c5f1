#pragma once

#include <courier/schema/outbound_message.hpp>
#include <scale/scale.hpp>

namespace courier::schema::encoding::scale {

void encode(courier::schema::outbound_message<1>&& o, ::scale::Encoder& encoder);
void decode(courier::schema::outbound_message<1>&& o, ::scale::Decoder& decoder);

}  // namespace courier::schema::encoding::scale
