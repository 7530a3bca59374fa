#include <timeshare/registry/registry.hpp>

#include <iterator>
#include <limits>
#include <utility>

using namespace timeshare::schema;

namespace timeshare::registry {

namespace {

using empty_result_t = registry_result<>;

constexpr auto kNotInitializedLog = "registry is not initialized";

}  // namespace

registry::registry(encoder_t& encoder,
                   storage_t& storage,
                   std::shared_ptr<spdlog::logger> logger)
    : encoder_{encoder}, storage_{storage}, logger_{std::move(logger)} {
  if (!logger_) {
    logger_ = spdlog::default_logger();
  }
}

template <typename T>
std::optional<T> registry::load(const key::data_key_t& key) const {
  auto raw_key = key::make_key(encoder_, key);
  return storage_.get<T>(encoder_, bytes_view_t{raw_key.data(), raw_key.size()});
}

template <typename T>
timeshare::storage::key_value_entry_t registry::make_entry(
    const key::data_key_t& key,
    const T& value) const {
  return {key::make_key(encoder_, key), encoder_.encode(value)};
}

std::optional<signer_id_t> registry::load_admin() const {
  return load<signer_id_t>(key::admin_key{});
}

void registry::commit(entries_t entries, const entries_t& staged) {
  entries.insert(std::end(entries), std::begin(staged), std::end(staged));
  storage_.write(entries);
}

registry_result<> registry::initialize(const signer_id_t& admin,
                                       const entries_t& staged) {
  auto lock = std::scoped_lock{mutex_};
  auto admin_key = key::make_key(encoder_, key::admin_key{});
  if (storage_.contains(bytes_view_t{admin_key.data(), admin_key.size()})) {
    logger_->debug("Rejected initialize: registry already has an admin");
    return empty_result_t::failure(registry_error_code::already_initialized,
                                   "registry already initialized");
  }

  commit({make_entry(key::admin_key{}, admin),
          make_entry(key::counter_key{}, token_id_t{0})},
         staged);
  logger_->info("Initialized timeshare registry with admin {}",
                to_string(admin));
  return empty_result_t::success({});
}

registry_result<token_id_t> registry::mint(const authorizer_t& authorizer,
                                           const signer_id_t& caller,
                                           const signer_id_t& recipient,
                                           std::string hotel,
                                           std::string room,
                                           const week_t week,
                                           const entries_t& staged) {
  using result_t = registry_result<token_id_t>;
  auto lock = std::scoped_lock{mutex_};

  auto admin = load_admin();
  auto counter = load<token_id_t>(key::counter_key{});
  if (!admin || !counter) {
    return result_t::failure(registry_error_code::not_initialized,
                             kNotInitializedLog);
  }
  if (caller != *admin) {
    logger_->debug("Rejected mint from non-admin {}", to_string(caller));
    return result_t::failure(registry_error_code::unauthorized,
                             "caller is not the registry admin");
  }
  if (!authorizer || !authorizer(caller)) {
    logger_->debug("Rejected mint: admin {} did not authorize the call",
                   to_string(caller));
    return result_t::failure(registry_error_code::unauthorized,
                             "admin authorization missing");
  }
  if (*counter == std::numeric_limits<token_id_t>::max()) {
    return result_t::failure(registry_error_code::counter_overflow,
                             "token id space exhausted");
  }

  const auto token_id = *counter + 1;
  auto info = timeshare_info_t{
      .hotel = std::move(hotel), .room = std::move(room), .week = week};
  commit({make_entry(key::info_key{token_id}, info),
          make_entry(key::owner_key{token_id}, recipient),
          make_entry(key::counter_key{}, token_id)},
         staged);

  logger_->info("Minted timeshare #{} for {}", token_id, to_string(recipient));
  return result_t::success(token_id);
}

registry_result<> registry::transfer(const authorizer_t& authorizer,
                                     const signer_id_t& caller,
                                     const signer_id_t& from,
                                     const signer_id_t& to,
                                     const token_id_t token_id,
                                     const entries_t& staged) {
  auto lock = std::scoped_lock{mutex_};

  if (!load_admin()) {
    return empty_result_t::failure(registry_error_code::not_initialized,
                                   kNotInitializedLog);
  }
  auto owner = load<signer_id_t>(key::owner_key{token_id});
  if (!owner) {
    return empty_result_t::failure(registry_error_code::token_not_found,
                                   "token does not exist");
  }
  if (caller != from || !authorizer || !authorizer(from)) {
    logger_->debug("Rejected transfer of timeshare #{}: {} is not authorized "
                   "for {}",
                   token_id, to_string(caller), to_string(from));
    return empty_result_t::failure(registry_error_code::unauthorized,
                                   "caller is not authorized for 'from'");
  }
  if (*owner != from) {
    logger_->debug("Rejected transfer of timeshare #{}: {} is not the owner",
                   token_id, to_string(from));
    return empty_result_t::failure(registry_error_code::not_owner,
                                   "'from' is not the token owner");
  }

  commit({make_entry(key::owner_key{token_id}, to)}, staged);
  logger_->info("Transferred timeshare #{} from {} to {}", token_id,
                to_string(from), to_string(to));
  return empty_result_t::success({});
}

registry_result<timeshare_info_t> registry::get_info(
    const token_id_t token_id) const {
  using result_t = registry_result<timeshare_info_t>;
  auto lock = std::scoped_lock{mutex_};
  if (!load_admin()) {
    return result_t::failure(registry_error_code::not_initialized,
                             kNotInitializedLog);
  }
  auto info = load<timeshare_info_t>(key::info_key{token_id});
  if (!info) {
    return result_t::failure(registry_error_code::token_not_found,
                             "token does not exist");
  }
  return result_t::success(std::move(*info));
}

registry_result<signer_id_t> registry::owner_of(
    const token_id_t token_id) const {
  using result_t = registry_result<signer_id_t>;
  auto lock = std::scoped_lock{mutex_};
  if (!load_admin()) {
    return result_t::failure(registry_error_code::not_initialized,
                             kNotInitializedLog);
  }
  auto owner = load<signer_id_t>(key::owner_key{token_id});
  if (!owner) {
    return result_t::failure(registry_error_code::token_not_found,
                             "token does not exist");
  }
  return result_t::success(std::move(*owner));
}

registry_result<signer_id_t> registry::admin() const {
  using result_t = registry_result<signer_id_t>;
  auto lock = std::scoped_lock{mutex_};
  auto admin = load_admin();
  if (!admin) {
    return result_t::failure(registry_error_code::not_initialized,
                             kNotInitializedLog);
  }
  return result_t::success(std::move(*admin));
}

registry_result<token_id_t> registry::token_count() const {
  using result_t = registry_result<token_id_t>;
  auto lock = std::scoped_lock{mutex_};
  auto counter = load<token_id_t>(key::counter_key{});
  if (!counter) {
    return result_t::failure(registry_error_code::not_initialized,
                             kNotInitializedLog);
  }
  return result_t::success(*counter);
}

}  // namespace timeshare::registry
