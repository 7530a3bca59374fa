#pragma once
#include <timeshare/schema/timeshare_info.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace timeshare::schema::encoding::scale {

void encode(const timeshare_info<1>& o, ::scale::Encoder& encoder);
void decode(timeshare_info<1>& o, ::scale::Decoder& decoder);

}  // namespace timeshare::schema::encoding::scale
