#pragma once
#include <timeshare/schema/primitives.hpp>

#include <string>

namespace timeshare::schema {

template <uint16_t Version>
struct timeshare_info;

/// Immutable descriptive record attached to a token when it is minted.
template <>
struct timeshare_info<1> final {
  uint16_t version{1};
  std::string hotel;
  std::string room;
  week_t week{};

  bool operator==(const timeshare_info&) const = default;
};

using timeshare_info_t = timeshare_info<1>;

}  // namespace timeshare::schema
