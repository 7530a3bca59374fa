#pragma once
#include <timeshare/common/critical.hpp>
#include <timeshare/schema/encoding/encoder.hpp>
#include <timeshare/schema/encoding/scale/call.hpp>
#include <timeshare/schema/encoding/scale/initialize_registry.hpp>
#include <timeshare/schema/encoding/scale/mint_timeshare.hpp>
#include <timeshare/schema/encoding/scale/primitives.hpp>
#include <timeshare/schema/encoding/scale/timeshare_info.hpp>
#include <timeshare/schema/encoding/scale/transfer_timeshare.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace timeshare::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  timeshare::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, timeshare::schema::bytes_t& out);

  template <typename T>
  T decode(const timeshare::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const timeshare::schema::bytes_view_t& bytes);
};

template <typename T>
timeshare::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    timeshare::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        timeshare::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const timeshare::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    timeshare::common::critical("failed to decode SCALE bytes");
  }
  return std::move(*decoded);
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const timeshare::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return std::move(decoded.value());
}

}  // namespace timeshare::schema::encoding
