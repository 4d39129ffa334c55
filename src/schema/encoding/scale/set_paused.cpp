#include <autoproof/schema/encoding/scale/set_paused.hpp>

using namespace autoproof::schema;

namespace autoproof::schema::encoding::scale {

void encode(set_paused<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.pause, encoder);
}

void decode(set_paused<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.pause, decoder);
}

}  // namespace autoproof::schema::encoding::scale
