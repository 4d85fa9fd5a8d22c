#pragma once
#include <tender/schema/offer.hpp>
#include <scale/scale.hpp>

// Amounts travel as 32-byte big-endian words so the record layout does not
// depend on the codec's big-integer support.
namespace tender::schema::encoding::scale {

void encode(tender::schema::offer<1>&& o, ::scale::Encoder& encoder);
void decode(tender::schema::offer<1>&& o, ::scale::Decoder& decoder);

}  // namespace tender::schema::encoding::scale
