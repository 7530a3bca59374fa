#pragma once

#include <timeshare/schema/registry_error_code.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace timeshare::schema {

inline constexpr auto kRegistryCodespace = std::string_view{"timeshare.registry"};

/// Outcome of a registry operation. `code` is 0 on success, otherwise a
/// registry_error_code value; `value` is only engaged on success.
template <typename T = std::monostate>
struct registry_result final {
  uint32_t code{};
  std::optional<T> value;
  std::string log;
  std::string codespace;

  bool ok() const { return code == 0; }

  std::optional<registry_error_code> error() const {
    if (code == 0) {
      return std::nullopt;
    }
    return static_cast<registry_error_code>(code);
  }

  static registry_result success(T result) {
    return registry_result{.code = 0,
                           .value = std::move(result),
                           .log = {},
                           .codespace = std::string{kRegistryCodespace}};
  }

  static registry_result failure(const registry_error_code error,
                                 std::string log) {
    return registry_result{.code = static_cast<uint32_t>(error),
                           .value = std::nullopt,
                           .log = std::move(log),
                           .codespace = std::string{kRegistryCodespace}};
  }
};

}  // namespace timeshare::schema
