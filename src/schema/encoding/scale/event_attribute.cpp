#include <scrip/schema/encoding/scale/event_attribute.hpp>

using namespace scrip::schema;

namespace scrip::schema::encoding::scale {

void encode(event_attribute<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.key, encoder);
  encode(o.value, encoder);
  encode(o.index, encoder);
}

void decode(event_attribute<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.key, decoder);
  decode(o.value, decoder);
  decode(o.index, decoder);
}

}  // namespace scrip::schema::encoding::scale
