#pragma once
#include <timeshare/schema/initialize_registry.hpp>
#include <timeshare/schema/mint_timeshare.hpp>
#include <timeshare/schema/primitives.hpp>
#include <timeshare/schema/transfer_timeshare.hpp>

#include <variant>

namespace timeshare::schema {

using call_payload_t = std::
    variant<initialize_registry_t, mint_timeshare_t, transfer_timeshare_t>;

template <uint16_t Version>
struct call;

/// Signed registry call. `signer` is the caller; `signature` covers every
/// field before it (see signing_payload). `nonce` must be one past the
/// signer's last accepted nonce.
template <>
struct call<1> final {
  uint16_t version{1};
  hash32_t registry_id{};
  uint64_t nonce{};
  signer_id_t signer{};
  call_payload_t payload{};
  signature_t signature;
};

using call_t = call<1>;

}  // namespace timeshare::schema
