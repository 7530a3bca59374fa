#pragma once

#include <openssl/evp.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>
#include <timeshare/execution/engine.hpp>
#include <timeshare/execution/signing.hpp>
#include <timeshare/schema/call.hpp>
#include <timeshare/schema/encoding/scale/encoder.hpp>
#include <timeshare/storage/rocksdb/storage.hpp>
#include <timeshare/testing/common.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace timeshare::testing {

using engine_encoder_t = timeshare::schema::encoding::encoder<
    timeshare::schema::encoding::scale_encoder_tag>;

inline timeshare::schema::call_t make_call(
    const timeshare::schema::hash32_t& registry_id,
    const timeshare::schema::signer_id_t& signer,
    const timeshare::schema::call_payload_t& payload,
    const uint64_t nonce = 1) {
  return timeshare::schema::call_t{
      .version = 1,
      .registry_id = registry_id,
      .nonce = nonce,
      .signer = signer,
      .payload = payload,
      .signature = timeshare::schema::ed25519_signature_t{}};
}

inline timeshare::schema::bytes_t encode_call(
    const timeshare::schema::call_t& call) {
  auto encoder = engine_encoder_t{};
  return encoder.encode(call);
}

/// Freshly generated ed25519 key that signs call payloads.
class ed25519_key final {
 public:
  ed25519_key() : pkey_{nullptr, EVP_PKEY_free} {
    auto ctx = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>{
        EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), EVP_PKEY_CTX_free};
    auto* raw = static_cast<EVP_PKEY*>(nullptr);
    if (ctx && EVP_PKEY_keygen_init(ctx.get()) == 1 &&
        EVP_PKEY_keygen(ctx.get(), &raw) == 1) {
      pkey_.reset(raw);
    }
    if (pkey_) {
      auto size = signer_.public_key.size();
      EVP_PKEY_get_raw_public_key(pkey_.get(), signer_.public_key.data(),
                                  &size);
    }
  }

  bool valid() const { return pkey_ != nullptr; }

  timeshare::schema::signer_id_t signer() const {
    return timeshare::schema::signer_id_t{signer_};
  }

  timeshare::schema::ed25519_signature_t sign(
      const timeshare::schema::bytes_view_t& message) const {
    auto signature = timeshare::schema::ed25519_signature_t{};
    auto size = signature.size();
    auto ctx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>{
        EVP_MD_CTX_new(), EVP_MD_CTX_free};
    if (ctx &&
        EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr,
                           pkey_.get()) == 1) {
      EVP_DigestSign(ctx.get(), signature.data(), &size, message.data(),
                     message.size());
    }
    return signature;
  }

  /// Sign `call` in place over its signing payload.
  void sign(timeshare::schema::call_t& call) const {
    auto payload = timeshare::execution::signing_payload(call);
    call.signature = sign(
        timeshare::schema::bytes_view_t{payload.data(), payload.size()});
  }

 private:
  std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> pkey_;
  timeshare::schema::ed25519_signer_id signer_{};
};

class execution_fixture final {
 public:
  explicit execution_fixture(const std::string_view db_prefix,
                             const bool strict_crypto = false)
      : db_path_{make_db_path(db_prefix)},
        encoder_{},
        storage_{timeshare::storage::make_storage<
            timeshare::storage::rocksdb_storage_tag>(db_path_)},
        engine_{encoder_, storage_, timeshare::execution::default_registry_id(),
                strict_crypto,
                std::make_shared<spdlog::logger>(
                    "engine_test",
                    std::make_shared<spdlog::sinks::null_sink_mt>())} {}

  execution_fixture(const execution_fixture&) = delete;
  execution_fixture& operator=(const execution_fixture&) = delete;
  execution_fixture(execution_fixture&&) = delete;
  execution_fixture& operator=(execution_fixture&&) = delete;

  ~execution_fixture() { remove_path(db_path_); }

  engine_encoder_t& encoder() { return encoder_; }

  timeshare::execution::engine& engine() { return engine_; }

  timeshare::schema::hash32_t registry_id() const {
    return engine_.registry_id();
  }

  timeshare::schema::call_result_t execute(
      const timeshare::schema::call_t& call) {
    auto raw = encode_call(call);
    return engine_.execute(
        timeshare::schema::bytes_view_t{raw.data(), raw.size()});
  }

  timeshare::schema::call_result_t check(
      const timeshare::schema::call_t& call) const {
    auto raw = encode_call(call);
    return engine_.check_call(
        timeshare::schema::bytes_view_t{raw.data(), raw.size()});
  }

  static timeshare::execution::signature_verifier_t allow_all_verifier() {
    return [](const timeshare::schema::bytes_view_t&,
              const timeshare::schema::signer_id_t&,
              const timeshare::schema::signature_t&) { return true; };
  }

  static timeshare::execution::signature_verifier_t deny_all_verifier() {
    return [](const timeshare::schema::bytes_view_t&,
              const timeshare::schema::signer_id_t&,
              const timeshare::schema::signature_t&) { return false; };
  }

 private:
  std::string db_path_;
  engine_encoder_t encoder_;
  timeshare::storage::storage<timeshare::storage::rocksdb_storage_tag> storage_;
  timeshare::execution::engine engine_;
};

}  // namespace timeshare::testing
