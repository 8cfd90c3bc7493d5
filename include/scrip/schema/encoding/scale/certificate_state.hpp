#pragma once
#include <scrip/schema/certificate_state.hpp>
#include <scale/scale.hpp>

namespace scrip::schema::encoding::scale {

void encode(scrip::schema::certificate_state<1>&& o, ::scale::Encoder& encoder);
void decode(scrip::schema::certificate_state<1>&& o, ::scale::Decoder& decoder);

}  // namespace scrip::schema::encoding::scale
