#pragma once
#include <timeshare/schema/transfer_timeshare.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace timeshare::schema::encoding::scale {

void encode(const transfer_timeshare<1>& o, ::scale::Encoder& encoder);
void decode(transfer_timeshare<1>& o, ::scale::Decoder& decoder);

}  // namespace timeshare::schema::encoding::scale
