#include <timeshare/schema/encoding/scale/primitives.hpp>
#include <timeshare/schema/encoding/scale/transfer_timeshare.hpp>

using namespace timeshare::schema;

namespace timeshare::schema::encoding::scale {

using ::scale::decode;
using ::scale::encode;

void encode(const transfer_timeshare<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.from, encoder);
  encode(o.to, encoder);
  encode(o.token_id, encoder);
}

void decode(transfer_timeshare<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.from, decoder);
  decode(o.to, decoder);
  decode(o.token_id, decoder);
}

}  // namespace timeshare::schema::encoding::scale
