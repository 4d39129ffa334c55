#include <autoproof/schema/encoding/scale/part_metadata.hpp>

using namespace autoproof::schema;

namespace autoproof::schema::encoding::scale {

void encode(part_metadata<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.serial_number, encoder);
  encode(o.manufacturer, encoder);
  encode(o.production_date, encoder);
  encode(o.material_spec, encoder);
  encode(o.status, encoder);
  encode(o.last_owner, encoder);
  encode(o.origin_factory, encoder);
}

void decode(part_metadata<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.serial_number, decoder);
  decode(o.manufacturer, decoder);
  decode(o.production_date, decoder);
  decode(o.material_spec, decoder);
  decode(o.status, decoder);
  decode(o.last_owner, decoder);
  decode(o.origin_factory, decoder);
}

}  // namespace autoproof::schema::encoding::scale
