#pragma once

#include <timeshare/schema/primitives.hpp>

#include <array>
#include <string_view>
#include <variant>

// Canonical key layout for registry state: a raw keyspace prefix followed by
// the SCALE-encoded id. Singleton slots and per-token records each get their
// own prefix, so a token id can never alias another namespace.
namespace timeshare::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kAdminKeyPrefix{"SYS|STATE|ADMIN|"};
inline constexpr std::string_view kCounterKeyPrefix{"SYS|STATE|COUNTER|"};
inline constexpr std::string_view kInfoKeyPrefix{"SYS|STATE|INFO|"};
inline constexpr std::string_view kOwnerKeyPrefix{"SYS|STATE|OWNER|"};
inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};

inline constexpr std::array<std::string_view, 5> kRegistryKeyspaces{
    kAdminKeyPrefix, kCounterKeyPrefix, kInfoKeyPrefix, kOwnerKeyPrefix,
    kNonceKeyPrefix};

struct admin_key final {};
struct counter_key final {};
struct info_key final {
  token_id_t token_id{};
};
struct owner_key final {
  token_id_t token_id{};
};

// Last accepted call nonce of a signer.
struct nonce_key final {
  signer_id_t signer{};
};

using data_key_t =
    std::variant<admin_key, counter_key, info_key, owner_key, nonce_key>;

template <typename Encoder, typename T>
timeshare::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                             std::string_view prefix,
                                             const T& id) {
  auto key = timeshare::schema::make_bytes(prefix);
  encoder.encode(id, key);
  return key;
}

inline timeshare::schema::bytes_t make_prefix_key(std::string_view prefix) {
  return timeshare::schema::make_bytes(prefix);
}

template <typename Encoder>
timeshare::schema::bytes_t make_key(Encoder& encoder, const data_key_t& key) {
  return std::visit(
      overloaded{[&](const admin_key&) {
                   return make_prefix_key(kAdminKeyPrefix);
                 },
                 [&](const counter_key&) {
                   return make_prefix_key(kCounterKeyPrefix);
                 },
                 [&](const info_key& value) {
                   return make_prefixed_key(encoder, kInfoKeyPrefix,
                                            value.token_id);
                 },
                 [&](const owner_key& value) {
                   return make_prefixed_key(encoder, kOwnerKeyPrefix,
                                            value.token_id);
                 },
                 [&](const nonce_key& value) {
                   return make_prefixed_key(encoder, kNonceKeyPrefix,
                                            value.signer);
                 }},
      key);
}

}  // namespace timeshare::schema::key
