#pragma once

#include <courier/schema/transaction_event.hpp>
#include <scale/scale.hpp>

namespace courier::schema::encoding::scale {

void encode(courier::schema::transaction_event<1>&& o, ::scale::Encoder& encoder);
void decode(courier::schema::transaction_event<1>&& o, ::scale::Decoder& decoder);

}  // namespace courier::schema::encoding::scale
