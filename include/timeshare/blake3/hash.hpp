#pragma once
#include <timeshare/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace timeshare::blake3 {

timeshare::schema::hash32_t hash(const std::string_view& str);
timeshare::schema::hash32_t hash(const timeshare::schema::bytes_view_t& bytes);

}  // namespace timeshare::blake3
