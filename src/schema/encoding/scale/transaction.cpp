#include <autoproof/schema/encoding/scale/burn_part.hpp>
#include <autoproof/schema/encoding/scale/register_part.hpp>
#include <autoproof/schema/encoding/scale/set_paused.hpp>
#include <autoproof/schema/encoding/scale/transaction.hpp>
#include <autoproof/schema/encoding/scale/transfer_admin.hpp>
#include <autoproof/schema/encoding/scale/transfer_part.hpp>
#include <autoproof/schema/encoding/scale/update_part_status.hpp>

using namespace autoproof::schema;

namespace autoproof::schema::encoding::scale {

void encode(transaction<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.chain_id, encoder);
  encode(o.caller, encoder);
  encode(o.payload, encoder);
}

void decode(transaction<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.chain_id, decoder);
  decode(o.caller, decoder);
  decode(o.payload, decoder);
}

}  // namespace autoproof::schema::encoding::scale
