#include <autoproof/schema/encoding/scale/register_part.hpp>

using namespace autoproof::schema;

namespace autoproof::schema::encoding::scale {

void encode(register_part<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.serial_number, encoder);
  encode(o.material_spec, encoder);
  encode(o.origin_factory, encoder);
}

void decode(register_part<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.serial_number, decoder);
  decode(o.material_spec, decoder);
  decode(o.origin_factory, decoder);
}

}  // namespace autoproof::schema::encoding::scale
