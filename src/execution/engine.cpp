#include <spdlog/spdlog.h>
#include <timeshare/crypto/verify.hpp>
#include <timeshare/execution/engine.hpp>
#include <timeshare/execution/signing.hpp>
#include <timeshare/schema/encoding/scale/encoder.hpp>
#include <timeshare/schema/key/registry_keys.hpp>
#include <timeshare/schema/registry_error_code.hpp>

#include <string>
#include <tuple>
#include <utility>
#include <vector>

using namespace timeshare::schema;

namespace {

using encoder_t = timeshare::schema::encoding::encoder<
    timeshare::schema::encoding::scale_encoder_tag>;

constexpr auto kCheckCodespace = std::string_view{"timeshare.check"};
constexpr auto kExecuteCodespace = std::string_view{"timeshare.execute"};
constexpr auto kQueryCodespace = std::string_view{"timeshare.query"};

call_result_t make_call_error(const call_error_code code,
                              const std::string_view codespace,
                              std::string log,
                              std::string info = {}) {
  auto result = call_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

query_result_t make_query_error(const query_error_code code,
                                std::string log,
                                const bytes_view_t& key) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.key = make_bytes(key);
  result.codespace = std::string{kQueryCodespace};
  return result;
}

template <typename T>
call_result_t from_registry_result(const registry_result<T>& outcome,
                                   std::string_view accepted) {
  auto result = call_result_t{};
  result.code = outcome.code;
  result.codespace = outcome.codespace;
  if (outcome.ok()) {
    result.info = std::string{accepted};
  } else {
    result.log = outcome.log;
    result.info = std::string{to_string(*outcome.error())};
  }
  return result;
}

std::optional<call_t> decode_call(encoder_t& encoder,
                                  const bytes_view_t& raw_call,
                                  std::string& error) {
  if (raw_call.empty()) {
    error = "empty call";
    return std::nullopt;
  }
  auto call = encoder.try_decode<call_t>(raw_call);
  if (!call) {
    error = "call is not valid SCALE";
  }
  return call;
}

bool signature_matches_signer(const call_t& call) {
  return std::visit(
      overloaded{[&](const ed25519_signer_id&) {
                   return std::holds_alternative<ed25519_signature_t>(
                       call.signature);
                 },
                 [&](const secp256k1_signer_id&) {
                   return std::holds_alternative<secp256k1_signature_t>(
                       call.signature);
                 },
                 [](const named_signer_t&) { return true; }},
      call.signer);
}

}  // namespace

namespace timeshare::execution {

engine::engine(encoder_t& encoder,
               timeshare::storage::storage<
                   timeshare::storage::rocksdb_storage_tag>& storage,
               hash32_t registry_id,
               const bool require_strict_crypto,
               std::shared_ptr<spdlog::logger> logger)
    : encoder_{encoder},
      storage_{storage},
      registry_{encoder, storage, logger},
      registry_id_{registry_id},
      require_strict_crypto_{require_strict_crypto},
      signature_verifier_{timeshare::crypto::verify_signature},
      logger_{logger ? std::move(logger) : spdlog::default_logger()} {
  if (require_strict_crypto_ && !timeshare::crypto::available()) {
    logger_->warn(
        "OpenSSL lacks ed25519 or secp256k1; signed calls will not verify");
  }
  logger_->info("Execution engine ready for registry {} (strict crypto: {})",
                to_hex(registry_id_), require_strict_crypto_);
}

call_result_t engine::check_call(const bytes_view_t& raw_call) const {
  auto lock = std::scoped_lock{mutex_};
  auto error = std::string{};
  auto call = decode_call(encoder_, raw_call, error);
  if (!call) {
    return make_call_error(call_error_code::invalid_call, kCheckCodespace,
                           "invalid call", error);
  }
  if (auto rejected = validate_call(*call, kCheckCodespace)) {
    return *rejected;
  }
  if (require_strict_crypto_ && !verify(*call)) {
    return make_call_error(call_error_code::signature_verification_failed,
                           kCheckCodespace, "signature verification failed");
  }
  auto result = call_result_t{};
  result.codespace = std::string{kCheckCodespace};
  result.info = "call admitted";
  return result;
}

call_result_t engine::execute(const bytes_view_t& raw_call) {
  auto error = std::string{};
  auto call = decode_call(encoder_, raw_call, error);
  if (!call) {
    logger_->debug("Dropping undecodable call: {}", error);
    return make_call_error(call_error_code::invalid_call, kExecuteCodespace,
                           "invalid call", error);
  }
  auto lock = std::scoped_lock{mutex_};
  if (auto rejected = validate_call(*call, kExecuteCodespace)) {
    return *rejected;
  }
  return dispatch(*call);
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) const {
  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.codespace = std::string{kQueryCodespace};

  if (path == "/registry/keyspaces") {
    auto keyspaces = std::vector<std::string>{};
    for (const auto keyspace : key::kRegistryKeyspaces) {
      keyspaces.emplace_back(keyspace);
    }
    result.value = encoder_.encode(keyspaces);
    return result;
  }

  if (path == "/registry/info") {
    auto admin = registry_.admin();
    auto count = registry_.token_count();
    if (!admin.ok() || !count.ok()) {
      return make_query_error(query_error_code::not_found,
                              "registry is not initialized", data);
    }
    result.value = encoder_.encode(std::tuple{*admin.value, *count.value});
    return result;
  }

  if (path == "/signer/nonce") {
    auto signer = encoder_.try_decode<signer_id_t>(data);
    if (!signer) {
      return make_query_error(query_error_code::invalid_key,
                              "expected SCALE signer id", data);
    }
    result.value = encoder_.encode(stored_nonce(*signer));
    return result;
  }

  if (path == "/token/info" || path == "/token/owner") {
    auto token_id = encoder_.try_decode<token_id_t>(data);
    if (!token_id) {
      return make_query_error(query_error_code::invalid_key,
                              "expected SCALE u64 token id", data);
    }
    if (path == "/token/info") {
      auto info = registry_.get_info(*token_id);
      if (!info.ok()) {
        return make_query_error(query_error_code::not_found, info.log, data);
      }
      result.value = encoder_.encode(*info.value);
    } else {
      auto owner = registry_.owner_of(*token_id);
      if (!owner.ok()) {
        return make_query_error(query_error_code::not_found, owner.log, data);
      }
      result.value = encoder_.encode(*owner.value);
    }
    return result;
  }

  return make_query_error(query_error_code::unsupported_path,
                          "unsupported query path", data);
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  if (!require_strict_crypto_) {
    logger_->debug("Ignoring signature verifier: strict crypto is disabled");
    return;
  }
  signature_verifier_ = std::move(verifier);
}

const hash32_t& engine::registry_id() const {
  return registry_id_;
}

timeshare::registry::registry& engine::state() {
  return registry_;
}

const timeshare::registry::registry& engine::state() const {
  return registry_;
}

std::optional<call_result_t> engine::validate_call(
    const call_t& call,
    const std::string_view codespace) const {
  if (call.version != 1) {
    return make_call_error(call_error_code::unsupported_call_version,
                           codespace, "unsupported call version",
                           "expected version 1");
  }
  if (call.registry_id != registry_id_) {
    return make_call_error(call_error_code::invalid_registry_id, codespace,
                           "call targets a different registry");
  }
  if (!signature_matches_signer(call)) {
    return make_call_error(call_error_code::invalid_signature_type, codespace,
                           "signature type does not match signer");
  }
  auto expected = stored_nonce(call.signer) + 1;
  if (call.nonce != expected) {
    logger_->debug("Rejected call from {}: nonce {} (expected {})",
                   to_string(call.signer), call.nonce, expected);
    return make_call_error(call_error_code::invalid_nonce, codespace,
                           "invalid nonce",
                           "expected nonce " + std::to_string(expected));
  }
  return std::nullopt;
}

bool engine::verify(const call_t& call) const {
  if (!signature_verifier_) {
    return false;
  }
  auto payload = signing_payload(call);
  return signature_verifier_(bytes_view_t{payload.data(), payload.size()},
                             call.signer, call.signature);
}

uint64_t engine::stored_nonce(const signer_id_t& signer) const {
  auto key = key::make_key(encoder_, key::nonce_key{signer});
  return storage_
      .get<uint64_t>(encoder_, bytes_view_t{key.data(), key.size()})
      .value_or(0);
}

timeshare::registry::authorizer_t engine::make_authorizer(
    const call_t& call) const {
  // Verification runs at most once and only if the registry asks.
  auto verified = std::make_shared<std::optional<bool>>();
  return [this, &call, verified](const signer_id_t& identity) {
    if (identity != call.signer) {
      return false;
    }
    if (!require_strict_crypto_) {
      return true;
    }
    if (!verified->has_value()) {
      *verified = verify(call);
    }
    return verified->value();
  };
}

call_result_t engine::dispatch(const call_t& call) {
  auto authorizer = make_authorizer(call);
  auto nonce_row = key::make_key(encoder_, key::nonce_key{call.signer});
  auto staged = timeshare::registry::registry::entries_t{
      {std::move(nonce_row), encoder_.encode(call.nonce)}};
  return std::visit(
      overloaded{
          [&](const initialize_registry_t& payload) {
            return from_registry_result(
                registry_.initialize(payload.admin, staged),
                "initialize accepted");
          },
          [&](const mint_timeshare_t& payload) {
            auto outcome =
                registry_.mint(authorizer, call.signer, payload.recipient,
                               payload.hotel, payload.room, payload.week,
                               staged);
            auto result = from_registry_result(outcome, "mint accepted");
            if (outcome.ok()) {
              result.data = encoder_.encode(*outcome.value);
            }
            return result;
          },
          [&](const transfer_timeshare_t& payload) {
            return from_registry_result(
                registry_.transfer(authorizer, call.signer, payload.from,
                                   payload.to, payload.token_id, staged),
                "transfer accepted");
          }},
      call.payload);
}

}  // namespace timeshare::execution
