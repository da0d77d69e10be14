#pragma once
#include <cursorctl/common/critical.hpp>
#include <cursorctl/schema/encoding/encoder.hpp>
#include <cursorctl/schema/encoding/scale/action_type.hpp>
#include <cursorctl/schema/encoding/scale/history_record.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace cursorctl::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  cursorctl::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, cursorctl::schema::bytes_t& out);

  template <typename T>
  T decode(const cursorctl::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const cursorctl::schema::bytes_view_t& bytes);
};

template <typename T>
cursorctl::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    cursorctl::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        cursorctl::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const cursorctl::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    cursorctl::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const cursorctl::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace cursorctl::schema::encoding
