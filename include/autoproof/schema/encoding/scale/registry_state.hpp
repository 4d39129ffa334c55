#pragma once
#include <autoproof/schema/registry_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace autoproof::schema::encoding::scale {

void encode(registry_state<1>&& o, ::scale::Encoder& encoder);
void decode(registry_state<1>&& o, ::scale::Decoder& decoder);

}  // namespace autoproof::schema::encoding::scale
