#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <cursorctl/common/errors.hpp>
#include <cursorctl/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>

namespace cursorctl::storage {

namespace detail {

inline cursorctl::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const cursorctl::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

[[noreturn]] inline void fail(const std::string_view what,
                              const ROCKSDB_NAMESPACE::Status& status) {
  spdlog::error("{}: {}", what, status.ToString());
  throw cursorctl::common::storage_error{std::string{what} + ": " +
                                         status.ToString()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const cursorctl::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const cursorctl::schema::bytes_view_t& key,
           const T& value) const;

  std::vector<key_value_entry_t> list_by_prefix(
      const cursorctl::schema::bytes_view_t& prefix) const;
  std::optional<key_value_entry_t> last_by_prefix(
      const cursorctl::schema::bytes_view_t& prefix) const;
  void write(const std::vector<key_value_entry_t>& entries) const;

 private:
  void require_open() const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline void storage<rocksdb_storage_tag>::require_open() const {
  if (!database) {
    throw cursorctl::common::storage_error{
        "RocksDB database is not initialized"};
  }
}

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const cursorctl::schema::bytes_view_t& key) const {
  require_open();
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    detail::fail("Failed to get value from RocksDB", status);
  }
  auto decoded = encoder.template try_decode<T>(
      cursorctl::schema::make_bytes_view(value));
  if (!decoded) {
    throw cursorctl::common::storage_error{
        "Failed to decode value read from RocksDB"};
  }
  return decoded;
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const cursorctl::schema::bytes_view_t& key,
    const T& value) const {
  require_open();
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(cursorctl::schema::make_bytes_view(encoded_value)));
  if (!status.ok()) {
    detail::fail("Failed to put value into RocksDB", status);
  }
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const cursorctl::schema::bytes_view_t& prefix) const {
  require_open();

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string = cursorctl::schema::make_string(prefix);

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    detail::fail("Failed iterating RocksDB prefix", iterator->status());
  }
  return entries;
}

inline std::optional<key_value_entry_t>
storage<rocksdb_storage_tag>::last_by_prefix(
    const cursorctl::schema::bytes_view_t& prefix) const {
  require_open();

  auto prefix_string = cursorctl::schema::make_string(prefix);
  // Every key under prefix sorts below prefix + 0xFF...; seek backwards from
  // just past the keyspace.
  auto upper = prefix_string;
  upper.append(16, static_cast<char>(0xFF));

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->SeekForPrev(upper);
  if (!iterator->status().ok()) {
    detail::fail("Failed seeking RocksDB prefix", iterator->status());
  }
  if (!iterator->Valid()) {
    return std::nullopt;
  }
  auto key_view =
      std::string_view{iterator->key().data(), iterator->key().size()};
  if (!key_view.starts_with(prefix_string)) {
    return std::nullopt;
  }
  return key_value_entry_t{detail::to_bytes(iterator->key()),
                           detail::to_bytes(iterator->value())};
}

inline void storage<rocksdb_storage_tag>::write(
    const std::vector<key_value_entry_t>& entries) const {
  require_open();

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status =
        batch.Put(detail::to_slice(cursorctl::schema::make_bytes_view(key)),
                  detail::to_slice(cursorctl::schema::make_bytes_view(value)));
    if (!put_status.ok()) {
      detail::fail("Failed staging RocksDB write batch", put_status);
    }
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    detail::fail("Failed to commit RocksDB write batch", write_status);
  }
}

}  // namespace cursorctl::storage
