#include <timeshare/blake3/hash.hpp>
#include <timeshare/execution/signing.hpp>
#include <timeshare/schema/encoding/scale/encoder.hpp>

#include <string_view>
#include <tuple>

namespace timeshare::execution {

timeshare::schema::hash32_t signing_payload(
    const timeshare::schema::call_t& call) {
  auto encoder = timeshare::schema::encoding::encoder<
      timeshare::schema::encoding::scale_encoder_tag>{};
  auto encoded = encoder.encode(
      std::tuple{call.version, call.registry_id, call.nonce, call.signer,
                 call.payload});
  return timeshare::blake3::hash(
      timeshare::schema::bytes_view_t{encoded.data(), encoded.size()});
}

timeshare::schema::hash32_t default_registry_id() {
  return timeshare::blake3::hash(std::string_view{"timeshare-registry"});
}

}  // namespace timeshare::execution
