#include <scrip/schema/encoding/scale/event.hpp>
#include <scrip/schema/encoding/scale/event_attribute.hpp>

using namespace scrip::schema;

namespace scrip::schema::encoding::scale {

void encode(event<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.sequence, encoder);
  encode(o.type, encoder);
  encode(o.attributes, encoder);
}

void decode(event<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.sequence, decoder);
  decode(o.type, decoder);
  decode(o.attributes, decoder);
}

}  // namespace scrip::schema::encoding::scale
