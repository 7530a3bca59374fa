#pragma once

#include <timeshare/schema/primitives.hpp>

#include <functional>

namespace timeshare::registry {

/// Host-provided proof check: true only when the current call genuinely
/// originates from the given identity. Evaluated before any state change.
using authorizer_t =
    std::function<bool(const timeshare::schema::signer_id_t& identity)>;

}  // namespace timeshare::registry
