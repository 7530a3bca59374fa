#pragma once

#include <timeshare/schema/primitives.hpp>

#include <cstdint>
#include <string>

namespace timeshare::schema {

template <uint16_t Version>
struct call_result;

template <>
struct call_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
};

using call_result_t = call_result<1>;

}  // namespace timeshare::schema
