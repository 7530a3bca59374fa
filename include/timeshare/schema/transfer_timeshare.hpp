#pragma once
#include <timeshare/schema/primitives.hpp>

namespace timeshare::schema {

template <uint16_t Version>
struct transfer_timeshare;

template <>
struct transfer_timeshare<1> final {
  uint16_t version{1};
  signer_id_t from;
  signer_id_t to;
  token_id_t token_id{};
};

using transfer_timeshare_t = transfer_timeshare<1>;

}  // namespace timeshare::schema
