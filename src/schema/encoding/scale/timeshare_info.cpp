#include <timeshare/schema/encoding/scale/timeshare_info.hpp>

using namespace timeshare::schema;

namespace timeshare::schema::encoding::scale {

using ::scale::decode;
using ::scale::encode;

void encode(const timeshare_info<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.hotel, encoder);
  encode(o.room, encoder);
  encode(o.week, encoder);
}

void decode(timeshare_info<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.hotel, decoder);
  decode(o.room, decoder);
  decode(o.week, decoder);
}

}  // namespace timeshare::schema::encoding::scale
