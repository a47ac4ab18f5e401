#include <chronicle/schema/encoding/scale/entity_record.hpp>

using namespace chronicle::schema;

namespace chronicle::schema::encoding::scale {

void encode(attribute_value&& o, ::scale::Encoder& encoder) {
  encode(o.name, encoder);
  encode(o.value, encoder);
}

void decode(attribute_value&& o, ::scale::Decoder& decoder) {
  decode(o.name, decoder);
  decode(o.value, decoder);
}

void encode(entity_record<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.entity_id, encoder);
  encode(o.vclock, encoder);
  encode(o.values, encoder);
}

void decode(entity_record<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.entity_id, decoder);
  decode(o.vclock, decoder);
  decode(o.values, decoder);
}

}  // namespace chronicle::schema::encoding::scale
