#pragma once
#include <timeshare/schema/call.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace timeshare::schema::encoding::scale {

void encode(const call<1>& o, ::scale::Encoder& encoder);
void decode(call<1>& o, ::scale::Decoder& decoder);

}  // namespace timeshare::schema::encoding::scale
