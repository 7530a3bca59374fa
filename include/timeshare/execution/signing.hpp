#pragma once

#include <timeshare/schema/call.hpp>
#include <timeshare/schema/primitives.hpp>

namespace timeshare::execution {

/// Bytes a caller signs for `call`: the blake3 digest of the SCALE encoding
/// of (version, registry_id, signer, payload). The signature itself is
/// excluded.
timeshare::schema::hash32_t signing_payload(
    const timeshare::schema::call_t& call);

/// Default registry id used when none is configured.
timeshare::schema::hash32_t default_registry_id();

}  // namespace timeshare::execution
