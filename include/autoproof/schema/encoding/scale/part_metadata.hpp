#pragma once
#include <autoproof/schema/part_metadata.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace autoproof::schema::encoding::scale {

void encode(part_metadata<1>&& o, ::scale::Encoder& encoder);
void decode(part_metadata<1>&& o, ::scale::Decoder& decoder);

}  // namespace autoproof::schema::encoding::scale
