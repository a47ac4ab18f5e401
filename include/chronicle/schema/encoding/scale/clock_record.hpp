#pragma once

#include <chronicle/schema/clock_record.hpp>
#include <scale/scale.hpp>

namespace chronicle::schema::encoding::scale {

void encode(chronicle::schema::clock_record<1>&& o, ::scale::Encoder& encoder);
void decode(chronicle::schema::clock_record<1>&& o, ::scale::Decoder& decoder);

}  // namespace chronicle::schema::encoding::scale
