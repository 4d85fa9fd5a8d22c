#pragma once
#include <tender/schema/event.hpp>
#include <scale/scale.hpp>

namespace tender::schema::encoding::scale {

void encode(tender::schema::event_attribute<1>&& o, ::scale::Encoder& encoder);
void decode(tender::schema::event_attribute<1>&& o, ::scale::Decoder& decoder);

void encode(tender::schema::event<1>&& o, ::scale::Encoder& encoder);
void decode(tender::schema::event<1>&& o, ::scale::Decoder& decoder);

}  // namespace tender::schema::encoding::scale
