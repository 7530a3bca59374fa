#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace timeshare::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using token_id_t = uint64_t;
using week_t = uint32_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string& bytes);
hash32_t make_hash32(const std::string_view& bytes);
std::optional<hash32_t> try_make_hash32(const std::string& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& bytes);
hash32_t make_zero_hash();

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);

std::string to_base64(const bytes_view_t& bytes);
bytes_t from_base64(std::string_view encoded);
std::optional<bytes_t> try_from_base64(std::string_view encoded);

struct ed25519_signer_id final {
  std::array<uint8_t, 32> public_key;

  bool operator==(const ed25519_signer_id&) const = default;
};

struct secp256k1_signer_id final {
  std::array<uint8_t, 33> public_key;

  bool operator==(const secp256k1_signer_id&) const = default;
};

using named_signer_t = hash32_t;  // Off-chain identity reference
using signer_id_t =
    std::variant<ed25519_signer_id, secp256k1_signer_id, named_signer_t>;

using ed25519_signature_t = std::array<uint8_t, 64>;
using secp256k1_signature_t = std::array<uint8_t, 65>;
using signature_t = std::variant<ed25519_signature_t, secp256k1_signature_t>;

/// Render an identity as `<kind>:<hex>` for log lines and CLI output.
std::string to_string(const signer_id_t& signer);

/// Parse the `to_string` form back into an identity. A bare 64-character hex
/// string is read as a named signer.
std::optional<signer_id_t> try_make_signer_id(std::string_view text);

}  // namespace timeshare::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
