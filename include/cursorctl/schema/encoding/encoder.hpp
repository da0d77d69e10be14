#pragma once
#include <cursorctl/schema/primitives.hpp>
#include <optional>
#include <span>

namespace cursorctl::schema::encoding {

/// Encoder selected at build time by library tag.
template <typename Library>
struct encoder {
  template <typename T>
  cursorctl::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, cursorctl::schema::bytes_t& out);

  template <typename T>
  T decode(const cursorctl::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const cursorctl::schema::bytes_view_t& bytes);
};

}  // namespace cursorctl::schema::encoding
