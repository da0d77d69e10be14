#pragma once
#include <cursorctl/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace cursorctl::storage {

using key_value_entry_t =
    std::pair<cursorctl::schema::bytes_t, cursorctl::schema::bytes_t>;

/// Key-value backend selected at build time by library tag.
///
/// Every operation reports backend failures by throwing
/// cursorctl::common::storage_error; nothing is written on a failed call.
template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const cursorctl::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const cursorctl::schema::bytes_view_t& key,
           const T& value) const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  std::vector<key_value_entry_t> list_by_prefix(
      const cursorctl::schema::bytes_view_t& prefix) const;

  /// Return the greatest key under prefix with its value.
  std::optional<key_value_entry_t> last_by_prefix(
      const cursorctl::schema::bytes_view_t& prefix) const;

  /// Atomically write all entries, or none of them.
  void write(const std::vector<key_value_entry_t>& entries) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace cursorctl::storage
