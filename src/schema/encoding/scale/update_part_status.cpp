#include <autoproof/schema/encoding/scale/update_part_status.hpp>

using namespace autoproof::schema;

namespace autoproof::schema::encoding::scale {

void encode(update_part_status<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.part_id, encoder);
  encode(o.new_status, encoder);
}

void decode(update_part_status<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.part_id, decoder);
  decode(o.new_status, decoder);
}

}  // namespace autoproof::schema::encoding::scale
