#pragma once
#include <autoproof/schema/transfer_part.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace autoproof::schema::encoding::scale {

void encode(transfer_part<1>&& o, ::scale::Encoder& encoder);
void decode(transfer_part<1>&& o, ::scale::Decoder& decoder);

}  // namespace autoproof::schema::encoding::scale
