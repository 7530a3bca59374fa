#pragma once
#include <timeshare/schema/initialize_registry.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace timeshare::schema::encoding::scale {

void encode(const initialize_registry<1>& o, ::scale::Encoder& encoder);
void decode(initialize_registry<1>& o, ::scale::Decoder& decoder);

}  // namespace timeshare::schema::encoding::scale
