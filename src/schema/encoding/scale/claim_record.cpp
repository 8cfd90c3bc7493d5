#include <scrip/schema/encoding/scale/claim_record.hpp>

using namespace scrip::schema;

namespace scrip::schema::encoding::scale {

void encode(claim_record<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.certificate_id, encoder);
  encode(o.holder, encoder);
}

void decode(claim_record<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.certificate_id, decoder);
  decode(o.holder, decoder);
}

}  // namespace scrip::schema::encoding::scale
