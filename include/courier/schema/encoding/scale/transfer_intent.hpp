#pragma once

#include <courier/schema/transfer_intent.hpp>
#include <scale/scale.hpp>

namespace courier::schema::encoding::scale {

void encode(courier::schema::transfer_intent<1>&& o, ::scale::Encoder& encoder);
void decode(courier::schema::transfer_intent<1>&& o, ::scale::Decoder& decoder);

}  // namespace courier::schema::encoding::scale
