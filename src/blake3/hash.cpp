#include <blake3.h>
#include <timeshare/blake3/hash.hpp>

namespace timeshare::blake3 {

namespace {

timeshare::schema::hash32_t digest(const void* data, const size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<timeshare::schema::hash32_t>);
  auto output = timeshare::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

timeshare::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

timeshare::schema::hash32_t hash(const timeshare::schema::bytes_view_t& bytes) {
  return digest(bytes.data(), bytes.size());
}

}  // namespace timeshare::blake3
