#pragma once
#include <scrip/schema/claim_record.hpp>
#include <scale/scale.hpp>

namespace scrip::schema::encoding::scale {

void encode(scrip::schema::claim_record<1>&& o, ::scale::Encoder& encoder);
void decode(scrip::schema::claim_record<1>&& o, ::scale::Decoder& decoder);

}  // namespace scrip::schema::encoding::scale
