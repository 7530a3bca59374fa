#pragma once
#include <timeshare/schema/primitives.hpp>
#include <optional>
#include <span>

namespace timeshare::schema::encoding {

// Codec abstraction selected at build time through a library tag. Storage
// and key construction are written against this interface so the wire
// format can be swapped without touching registry logic.
template <typename Library>
struct encoder {
  template <typename T>
  timeshare::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, timeshare::schema::bytes_t& out);

  template <typename T>
  T decode(const timeshare::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const timeshare::schema::bytes_view_t& bytes);
};

}  // namespace timeshare::schema::encoding
