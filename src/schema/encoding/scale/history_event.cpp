#include <autoproof/schema/encoding/scale/history_event.hpp>

using namespace autoproof::schema;

namespace autoproof::schema::encoding::scale {

void encode(history_event<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.event, encoder);
  encode(o.timestamp, encoder);
  encode(o.actor, encoder);
}

void decode(history_event<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.event, decoder);
  decode(o.timestamp, decoder);
  decode(o.actor, decoder);
}

}  // namespace autoproof::schema::encoding::scale
