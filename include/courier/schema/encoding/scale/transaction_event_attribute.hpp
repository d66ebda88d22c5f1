#pragma once

#include <courier/schema/transaction_event_attribute.hpp>
#include <scale/scale.hpp>

namespace courier::schema::encoding::scale {

void encode(courier::schema::transaction_event_attribute<1>&& o, ::scale::Encoder& encoder);
void decode(courier::schema::transaction_event_attribute<1>&& o, ::scale::Decoder& decoder);

}  // namespace courier::schema::encoding::scale
