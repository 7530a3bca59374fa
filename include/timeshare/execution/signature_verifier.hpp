#pragma once

#include <timeshare/schema/primitives.hpp>
#include <functional>

namespace timeshare::execution {

using signature_verifier_t =
    std::function<bool(const timeshare::schema::bytes_view_t& message,
                       const timeshare::schema::signer_id_t& signer,
                       const timeshare::schema::signature_t& signature)>;

}  // namespace timeshare::execution
