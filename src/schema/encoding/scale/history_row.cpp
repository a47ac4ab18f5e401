#include <chronicle/schema/encoding/scale/history_row.hpp>

using namespace chronicle::schema;

namespace chronicle::schema::encoding::scale {

void encode(history_row<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.entity_id, encoder);
  encode(o.vclock, encoder);
  encode(o.values, encoder);
  encode(o.tick_start, encoder);
  encode(o.tick_end, encoder);
}

void decode(history_row<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.entity_id, decoder);
  decode(o.vclock, decoder);
  decode(o.values, decoder);
  decode(o.tick_start, decoder);
  decode(o.tick_end, decoder);
}

}  // namespace chronicle::schema::encoding::scale
