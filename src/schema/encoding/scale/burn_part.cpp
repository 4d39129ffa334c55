#include <autoproof/schema/encoding/scale/burn_part.hpp>

using namespace autoproof::schema;

namespace autoproof::schema::encoding::scale {

void encode(burn_part<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.part_id, encoder);
}

void decode(burn_part<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.part_id, decoder);
}

}  // namespace autoproof::schema::encoding::scale
