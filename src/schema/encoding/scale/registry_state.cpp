#include <autoproof/schema/encoding/scale/registry_state.hpp>

using namespace autoproof::schema;

namespace autoproof::schema::encoding::scale {

void encode(registry_state<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.admin, encoder);
  encode(o.paused, encoder);
  encode(o.next_part_id, encoder);
}

void decode(registry_state<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.admin, decoder);
  decode(o.paused, decoder);
  decode(o.next_part_id, decoder);
}

}  // namespace autoproof::schema::encoding::scale
