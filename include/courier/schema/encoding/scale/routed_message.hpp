#pragma once

#include <courier/schema/routed_message.hpp>
#include <scale/scale.hpp>

namespace courier::schema::encoding::scale {

void encode(courier::schema::routed_message<1>&& o, ::scale::Encoder& encoder);
void decode(courier::schema::routed_message<1>&& o, ::scale::Decoder& decoder);

}  // namespace courier::schema::encoding::scale
