#pragma once

#include <spdlog/spdlog.h>
#include <timeshare/registry/authorizer.hpp>
#include <timeshare/schema/encoding/scale/encoder.hpp>
#include <timeshare/schema/key/registry_keys.hpp>
#include <timeshare/schema/primitives.hpp>
#include <timeshare/schema/registry_result.hpp>
#include <timeshare/schema/timeshare_info.hpp>
#include <timeshare/storage/rocksdb/storage.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace timeshare::registry {

/// Ownership registry for timeshare tokens.
///
/// All state lives in storage under the keys of schema::key::data_key_t:
/// the admin identity, the last issued token id, and per-token metadata and
/// owner records. Operations are serialized on an internal mutex, perform
/// every check before writing, and commit their writes as one batch, so a
/// rejected call leaves storage untouched.
class registry final {
 public:
  using encoder_t = timeshare::schema::encoding::encoder<
      timeshare::schema::encoding::scale_encoder_tag>;
  using storage_t =
      timeshare::storage::storage<timeshare::storage::rocksdb_storage_tag>;

  explicit registry(
      encoder_t& encoder,
      storage_t& storage,
      std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

  using entries_t = std::vector<timeshare::storage::key_value_entry_t>;

  /// Record `admin` as the minting authority and reset the counter to 0.
  ///
  /// First call wins; later calls fail with `already_initialized` and do
  /// not overwrite. Each mutating operation commits `staged` in the same
  /// batch as its own writes, and drops it on rejection.
  timeshare::schema::registry_result<> initialize(
      const timeshare::schema::signer_id_t& admin,
      const entries_t& staged = {});

  /// Issue the next token id to `recipient` with immutable metadata.
  ///
  /// `caller` must be the admin and `authorizer` must vouch for it.
  timeshare::schema::registry_result<timeshare::schema::token_id_t> mint(
      const authorizer_t& authorizer,
      const timeshare::schema::signer_id_t& caller,
      const timeshare::schema::signer_id_t& recipient,
      std::string hotel,
      std::string room,
      timeshare::schema::week_t week,
      const entries_t& staged = {});

  /// Move `token_id` from `from` to `to`.
  ///
  /// `caller` must be `from`, `authorizer` must vouch for `from`, and `from`
  /// must be the stored owner. `to == from` is an accepted no-op.
  timeshare::schema::registry_result<> transfer(
      const authorizer_t& authorizer,
      const timeshare::schema::signer_id_t& caller,
      const timeshare::schema::signer_id_t& from,
      const timeshare::schema::signer_id_t& to,
      timeshare::schema::token_id_t token_id,
      const entries_t& staged = {});

  /// Public metadata lookup; returns a copy of the stored record.
  timeshare::schema::registry_result<timeshare::schema::timeshare_info_t>
  get_info(timeshare::schema::token_id_t token_id) const;

  timeshare::schema::registry_result<timeshare::schema::signer_id_t> owner_of(
      timeshare::schema::token_id_t token_id) const;

  timeshare::schema::registry_result<timeshare::schema::signer_id_t> admin()
      const;

  /// Number of tokens minted so far, which is also the last issued id.
  timeshare::schema::registry_result<timeshare::schema::token_id_t>
  token_count() const;

 private:
  template <typename T>
  std::optional<T> load(const timeshare::schema::key::data_key_t& key) const;

  template <typename T>
  timeshare::storage::key_value_entry_t make_entry(
      const timeshare::schema::key::data_key_t& key,
      const T& value) const;

  std::optional<timeshare::schema::signer_id_t> load_admin() const;

  void commit(entries_t entries, const entries_t& staged);

  mutable std::mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace timeshare::registry
