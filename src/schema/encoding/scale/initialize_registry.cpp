#include <timeshare/schema/encoding/scale/initialize_registry.hpp>
#include <timeshare/schema/encoding/scale/primitives.hpp>

using namespace timeshare::schema;

namespace timeshare::schema::encoding::scale {

using ::scale::decode;
using ::scale::encode;

void encode(const initialize_registry<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.admin, encoder);
}

void decode(initialize_registry<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.admin, decoder);
}

}  // namespace timeshare::schema::encoding::scale
