#pragma once
#include <autoproof/schema/update_part_status.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace autoproof::schema::encoding::scale {

void encode(update_part_status<1>&& o, ::scale::Encoder& encoder);
void decode(update_part_status<1>&& o, ::scale::Decoder& decoder);

}  // namespace autoproof::schema::encoding::scale
