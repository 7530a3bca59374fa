#include <timeshare/schema/encoding/scale/primitives.hpp>

using namespace timeshare::schema;

namespace timeshare::schema::encoding::scale {

using ::scale::decode;
using ::scale::encode;

void encode(const ed25519_signer_id& o, ::scale::Encoder& encoder) {
  encode(o.public_key, encoder);
}

void decode(ed25519_signer_id& o, ::scale::Decoder& decoder) {
  decode(o.public_key, decoder);
}

void encode(const secp256k1_signer_id& o, ::scale::Encoder& encoder) {
  encode(o.public_key, encoder);
}

void decode(secp256k1_signer_id& o, ::scale::Decoder& decoder) {
  decode(o.public_key, decoder);
}

}  // namespace timeshare::schema::encoding::scale
