#pragma once

#include <chronicle/schema/history_row.hpp>
#include <scale/scale.hpp>

namespace chronicle::schema::encoding::scale {

void encode(chronicle::schema::history_row<1>&& o, ::scale::Encoder& encoder);
void decode(chronicle::schema::history_row<1>&& o, ::scale::Decoder& decoder);

}  // namespace chronicle::schema::encoding::scale
