#pragma once

#include <spdlog/spdlog.h>
#include <timeshare/execution/signature_verifier.hpp>
#include <timeshare/registry/authorizer.hpp>
#include <timeshare/registry/registry.hpp>
#include <timeshare/schema/call.hpp>
#include <timeshare/schema/call_error_code.hpp>
#include <timeshare/schema/call_result.hpp>
#include <timeshare/schema/encoding/encoder.hpp>
#include <timeshare/schema/primitives.hpp>
#include <timeshare/schema/query_error_code.hpp>
#include <timeshare/schema/query_result.hpp>
#include <timeshare/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace timeshare::execution {

/// Entry point for signed registry calls.
///
/// The engine decodes a SCALE-encoded call, checks its envelope, derives the
/// caller authorization from the call signature, and hands the payload to
/// the registry. It also serves the read-only query routes.
///
/// Each signer carries a stored nonce. A call is admitted only with the next
/// nonce, and an accepted call advances it in the registry's write batch, so
/// no signed call executes twice.
class engine final {
 public:
  /// Construct the engine over encoder/storage backends.
  ///
  /// `registry_id` binds signatures to one registry instance.
  /// `require_strict_crypto` enables real signature verification; when false,
  /// the call signer is trusted as authorized without checking signatures.
  explicit engine(
      timeshare::schema::encoding::encoder<
          timeshare::schema::encoding::scale_encoder_tag>& encoder,
      timeshare::storage::storage<timeshare::storage::rocksdb_storage_tag>&
          storage,
      timeshare::schema::hash32_t registry_id,
      bool require_strict_crypto = true,
      std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

  /// Admit a call without executing it.
  ///
  /// Performs decode, envelope checks and (in strict mode) signature
  /// verification. Never mutates registry state.
  timeshare::schema::call_result_t check_call(
      const timeshare::schema::bytes_view_t& raw_call) const;

  /// Decode, validate and execute one call against the registry.
  ///
  /// Registry rejections are reported with their registry_error_code value
  /// and the `timeshare.registry` codespace.
  timeshare::schema::call_result_t execute(
      const timeshare::schema::bytes_view_t& raw_call);

  /// Execute a read-path query by route.
  timeshare::schema::query_result_t query(
      std::string_view path,
      const timeshare::schema::bytes_view_t& data) const;

  /// Install runtime signature verifier callback.
  ///
  /// Ignored when strict-crypto mode is disabled.
  void set_signature_verifier(signature_verifier_t verifier);

  const timeshare::schema::hash32_t& registry_id() const;

  timeshare::registry::registry& state();
  const timeshare::registry::registry& state() const;

 private:
  /// Check version, registry id, signer/signature pairing and nonce.
  std::optional<timeshare::schema::call_result_t> validate_call(
      const timeshare::schema::call_t& call,
      std::string_view codespace) const;

  /// Authorizer granting exactly the identity that signed `call`.
  timeshare::registry::authorizer_t make_authorizer(
      const timeshare::schema::call_t& call) const;

  bool verify(const timeshare::schema::call_t& call) const;

  /// Last nonce accepted from `signer`, 0 when it never called.
  uint64_t stored_nonce(const timeshare::schema::signer_id_t& signer) const;

  timeshare::schema::call_result_t dispatch(
      const timeshare::schema::call_t& call);

  mutable std::mutex mutex_;
  timeshare::schema::encoding::encoder<
      timeshare::schema::encoding::scale_encoder_tag>& encoder_;
  timeshare::storage::storage<timeshare::storage::rocksdb_storage_tag>&
      storage_;
  timeshare::registry::registry registry_;
  timeshare::schema::hash32_t registry_id_;
  bool require_strict_crypto_{true};
  signature_verifier_t signature_verifier_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace timeshare::execution
