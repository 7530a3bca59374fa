#include <timeshare/schema/encoding/scale/mint_timeshare.hpp>
#include <timeshare/schema/encoding/scale/primitives.hpp>

using namespace timeshare::schema;

namespace timeshare::schema::encoding::scale {

using ::scale::decode;
using ::scale::encode;

void encode(const mint_timeshare<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.recipient, encoder);
  encode(o.hotel, encoder);
  encode(o.room, encoder);
  encode(o.week, encoder);
}

void decode(mint_timeshare<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.recipient, decoder);
  decode(o.hotel, decoder);
  decode(o.room, decoder);
  decode(o.week, decoder);
}

}  // namespace timeshare::schema::encoding::scale
