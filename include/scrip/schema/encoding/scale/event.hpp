#pragma once
#include <scrip/schema/event.hpp>
#include <scale/scale.hpp>

namespace scrip::schema::encoding::scale {

void encode(scrip::schema::event<1>&& o, ::scale::Encoder& encoder);
void decode(scrip::schema::event<1>&& o, ::scale::Decoder& decoder);

}  // namespace scrip::schema::encoding::scale
