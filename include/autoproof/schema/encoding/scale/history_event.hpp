#pragma once
#include <autoproof/schema/history_event.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace autoproof::schema::encoding::scale {

void encode(history_event<1>&& o, ::scale::Encoder& encoder);
void decode(history_event<1>&& o, ::scale::Decoder& decoder);

}  // namespace autoproof::schema::encoding::scale
