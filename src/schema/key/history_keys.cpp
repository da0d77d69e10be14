#include <cursorctl/schema/key/history_keys.hpp>

#include <boost/endian/buffers.hpp>

#include <algorithm>
#include <iterator>

namespace cursorctl::schema::key {

cursorctl::schema::bytes_t make_history_key(const uint64_t id) {
  auto encoded = boost::endian::big_uint64_buf_t{id};
  auto key = cursorctl::schema::make_bytes(kHistoryPrefix);
  key.reserve(key.size() + sizeof(encoded));
  key.insert(std::end(key), encoded.data(), encoded.data() + sizeof(encoded));
  return key;
}

cursorctl::schema::bytes_t make_history_prefix() {
  return cursorctl::schema::make_bytes(kHistoryPrefix);
}

cursorctl::schema::bytes_t make_history_sequence_key() {
  return cursorctl::schema::make_bytes(kHistorySequenceKey);
}

std::optional<uint64_t> parse_history_key(
    const cursorctl::schema::bytes_view_t& key) {
  auto key_view = cursorctl::schema::make_string_view(key);
  if (!key_view.starts_with(kHistoryPrefix)) {
    return std::nullopt;
  }
  auto encoded = boost::endian::big_uint64_buf_t{};
  if (key.size() - kHistoryPrefix.size() != sizeof(encoded)) {
    return std::nullopt;
  }
  std::copy_n(key.data() + kHistoryPrefix.size(), sizeof(encoded),
              encoded.data());
  return encoded.value();
}

}  // namespace cursorctl::schema::key
