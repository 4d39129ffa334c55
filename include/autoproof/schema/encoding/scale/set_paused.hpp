#pragma once
#include <autoproof/schema/set_paused.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace autoproof::schema::encoding::scale {

void encode(set_paused<1>&& o, ::scale::Encoder& encoder);
void decode(set_paused<1>&& o, ::scale::Decoder& decoder);

}  // namespace autoproof::schema::encoding::scale
