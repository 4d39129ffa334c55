#include <autoproof/schema/encoding/scale/transfer_admin.hpp>

using namespace autoproof::schema;

namespace autoproof::schema::encoding::scale {

void encode(transfer_admin<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.new_admin, encoder);
}

void decode(transfer_admin<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.new_admin, decoder);
}

}  // namespace autoproof::schema::encoding::scale
