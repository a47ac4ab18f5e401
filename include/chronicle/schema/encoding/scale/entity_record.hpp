#pragma once

#include <chronicle/schema/entity_record.hpp>
#include <scale/scale.hpp>

namespace chronicle::schema::encoding::scale {

void encode(chronicle::schema::attribute_value&& o, ::scale::Encoder& encoder);
void decode(chronicle::schema::attribute_value&& o, ::scale::Decoder& decoder);

void encode(chronicle::schema::entity_record<1>&& o, ::scale::Encoder& encoder);
void decode(chronicle::schema::entity_record<1>&& o, ::scale::Decoder& decoder);

}  // namespace chronicle::schema::encoding::scale
