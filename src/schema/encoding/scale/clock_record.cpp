#include <chronicle/schema/encoding/scale/clock_record.hpp>

using namespace chronicle::schema;

namespace chronicle::schema::encoding::scale {

void encode(clock_record<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.entity_id, encoder);
  encode(o.vclock, encoder);
  encode(o.tick_start, encoder);
  encode(o.tick_end, encoder);
  encode(o.activity_id, encoder);
}

void decode(clock_record<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.entity_id, decoder);
  decode(o.vclock, decoder);
  decode(o.tick_start, decoder);
  decode(o.tick_end, decoder);
  decode(o.activity_id, decoder);
}

}  // namespace chronicle::schema::encoding::scale
