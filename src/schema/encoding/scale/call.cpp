#include <timeshare/schema/encoding/scale/call.hpp>
#include <timeshare/schema/encoding/scale/initialize_registry.hpp>
#include <timeshare/schema/encoding/scale/mint_timeshare.hpp>
#include <timeshare/schema/encoding/scale/primitives.hpp>
#include <timeshare/schema/encoding/scale/transfer_timeshare.hpp>

using namespace timeshare::schema;

namespace timeshare::schema::encoding::scale {

using ::scale::decode;
using ::scale::encode;

void encode(const call<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.registry_id, encoder);
  encode(o.nonce, encoder);
  encode(o.signer, encoder);
  encode(o.payload, encoder);
  encode(o.signature, encoder);
}

void decode(call<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.registry_id, decoder);
  decode(o.nonce, decoder);
  decode(o.signer, decoder);
  decode(o.payload, decoder);
  decode(o.signature, decoder);
}

}  // namespace timeshare::schema::encoding::scale
