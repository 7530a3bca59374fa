#pragma once

#include <cstdint>

// Call admission failures. Numbered apart from registry_error_code so a
// call_result code identifies its layer on its own.
namespace timeshare::schema {

enum class call_error_code : uint32_t {
  invalid_call = 100,
  unsupported_call_version = 101,
  invalid_registry_id = 102,
  invalid_signature_type = 103,
  signature_verification_failed = 104,
  invalid_nonce = 105,
};

}  // namespace timeshare::schema
