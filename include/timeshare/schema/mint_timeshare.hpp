#pragma once
#include <timeshare/schema/primitives.hpp>

#include <string>

namespace timeshare::schema {

template <uint16_t Version>
struct mint_timeshare;

template <>
struct mint_timeshare<1> final {
  uint16_t version{1};
  signer_id_t recipient;
  std::string hotel;
  std::string room;
  week_t week{};
};

using mint_timeshare_t = mint_timeshare<1>;

}  // namespace timeshare::schema
