#pragma once
#include <timeshare/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace timeshare::storage {

using key_value_entry_t =
    std::pair<timeshare::schema::bytes_t, timeshare::schema::bytes_t>;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const timeshare::schema::bytes_view_t& key) const;

  /// Return true when a value is stored at key.
  bool contains(const timeshare::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const timeshare::schema::bytes_view_t& key,
           const T& value);

  /// Atomically persist all pre-encoded entries; readers observe either none
  /// or all of them.
  void write(const std::vector<key_value_entry_t>& entries);

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const timeshare::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace timeshare::storage
