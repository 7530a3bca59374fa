#pragma once
#include <timeshare/schema/primitives.hpp>

namespace timeshare::schema {

template <uint16_t Version>
struct initialize_registry;

template <>
struct initialize_registry<1> final {
  uint16_t version{1};
  signer_id_t admin;
};

using initialize_registry_t = initialize_registry<1>;

}  // namespace timeshare::schema
