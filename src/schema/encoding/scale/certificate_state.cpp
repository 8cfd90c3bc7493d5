#include <scrip/schema/encoding/scale/certificate_state.hpp>

using namespace scrip::schema;

namespace scrip::schema::encoding::scale {

void encode(certificate_state<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.certificate_id, encoder);
  encode(o.amount, encoder);
  encode(o.metadata, encoder);
  encode(o.delegates, encoder);
}

void decode(certificate_state<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.certificate_id, decoder);
  decode(o.amount, decoder);
  decode(o.metadata, decoder);
  decode(o.delegates, decoder);
}

}  // namespace scrip::schema::encoding::scale
