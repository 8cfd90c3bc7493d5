#pragma once
#include <scrip/schema/event_attribute.hpp>
#include <scale/scale.hpp>

namespace scrip::schema::encoding::scale {

void encode(scrip::schema::event_attribute<1>&& o, ::scale::Encoder& encoder);
void decode(scrip::schema::event_attribute<1>&& o, ::scale::Decoder& decoder);

}  // namespace scrip::schema::encoding::scale
