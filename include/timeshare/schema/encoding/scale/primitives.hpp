#pragma once
#include <timeshare/schema/primitives.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace timeshare::schema::encoding::scale {

void encode(const ed25519_signer_id& o, ::scale::Encoder& encoder);
void decode(ed25519_signer_id& o, ::scale::Decoder& decoder);

void encode(const secp256k1_signer_id& o, ::scale::Encoder& encoder);
void decode(secp256k1_signer_id& o, ::scale::Decoder& decoder);

}  // namespace timeshare::schema::encoding::scale
