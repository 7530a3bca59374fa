#pragma once

#include <timeshare/schema/primitives.hpp>

namespace timeshare::crypto {

/// True when the linked OpenSSL provides both ed25519 and secp256k1.
bool available();

/// Verify `signature` over `message` for a key-backed signer. Named signers
/// carry no key material and never verify.
bool verify_signature(const timeshare::schema::bytes_view_t& message,
                      const timeshare::schema::signer_id_t& signer,
                      const timeshare::schema::signature_t& signature);

}  // namespace timeshare::crypto
