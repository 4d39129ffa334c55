#pragma once
#include <autoproof/schema/burn_part.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace autoproof::schema::encoding::scale {

void encode(burn_part<1>&& o, ::scale::Encoder& encoder);
void decode(burn_part<1>&& o, ::scale::Decoder& decoder);

}  // namespace autoproof::schema::encoding::scale
