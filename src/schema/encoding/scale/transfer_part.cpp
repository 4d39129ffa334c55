#include <autoproof/schema/encoding/scale/transfer_part.hpp>

using namespace autoproof::schema;

namespace autoproof::schema::encoding::scale {

void encode(transfer_part<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.part_id, encoder);
  encode(o.new_owner, encoder);
}

void decode(transfer_part<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.part_id, decoder);
  decode(o.new_owner, decoder);
}

}  // namespace autoproof::schema::encoding::scale
