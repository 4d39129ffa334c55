#pragma once
#include <autoproof/schema/register_part.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace autoproof::schema::encoding::scale {

void encode(register_part<1>&& o, ::scale::Encoder& encoder);
void decode(register_part<1>&& o, ::scale::Decoder& decoder);

}  // namespace autoproof::schema::encoding::scale
