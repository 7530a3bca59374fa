#pragma once

#include <timeshare/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

// Registry failure taxonomy: stable numeric codes surfaced to callers.
namespace timeshare::schema {

enum class registry_error_code : uint32_t {
  already_initialized = 1,
  not_initialized = 2,
  unauthorized = 3,
  not_owner = 4,
  token_not_found = 5,
  counter_overflow = 6,
};

inline constexpr auto kRegistryErrorCodeNames =
    std::array<std::pair<std::string_view, registry_error_code>, 6>{{
        {"already_initialized", registry_error_code::already_initialized},
        {"not_initialized", registry_error_code::not_initialized},
        {"unauthorized", registry_error_code::unauthorized},
        {"not_owner", registry_error_code::not_owner},
        {"token_not_found", registry_error_code::token_not_found},
        {"counter_overflow", registry_error_code::counter_overflow},
    }};

template <>
inline std::optional<registry_error_code>
try_from_string<registry_error_code>(const std::string_view value) {
  return from_string(value, kRegistryErrorCodeNames);
}

inline std::string_view to_string(const registry_error_code code) {
  return to_string(code, kRegistryErrorCodeNames).value_or("unknown");
}

}  // namespace timeshare::schema
