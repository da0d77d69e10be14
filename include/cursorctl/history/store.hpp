#pragma once

#include <spdlog/spdlog.h>
#include <cursorctl/common/errors.hpp>
#include <cursorctl/schema/encoding/scale/encoder.hpp>
#include <cursorctl/schema/history_record.hpp>
#include <cursorctl/schema/key/history_keys.hpp>
#include <cursorctl/storage/storage.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace cursorctl::history {

using encoder_t = cursorctl::schema::encoding::encoder<
    cursorctl::schema::encoding::scale_encoder_tag>;

using action_filter_t =
    std::function<bool(cursorctl::schema::action_type_t)>;

/// Append-only log of completed user actions.
///
/// Records are immutable once written. Ids are assigned by the store,
/// start at 1 and increase by one per append, so id order is append order.
/// The store does not own the backend; it must outlive the store.
template <typename Library>
class store final {
 public:
  explicit store(cursorctl::storage::storage<Library>& storage)
      : storage_{storage} {}

  /// Persist `record` under the next id and return the stored record.
  ///
  /// The record row and the advanced sequence are committed in one batch;
  /// on failure storage_error propagates and nothing is written.
  cursorctl::schema::history_record_t append(
      cursorctl::schema::history_record_t record) {
    auto sequence_key = cursorctl::schema::key::make_history_sequence_key();
    auto next_id =
        storage_
            .template get<uint64_t>(
                encoder_, cursorctl::schema::make_bytes_view(sequence_key))
            .value_or(1);

    record.version = 1;
    record.id = next_id;

    auto entries = std::vector<cursorctl::storage::key_value_entry_t>{};
    entries.push_back({cursorctl::schema::key::make_history_key(next_id),
                       encoder_.encode(record)});
    entries.push_back({sequence_key, encoder_.encode(next_id + 1)});
    storage_.write(entries);

    spdlog::debug("Appended history record {} ({})", record.id,
                  cursorctl::schema::to_string(record.action));
    return record;
  }

  /// Most recent record, or std::nullopt when nothing was appended yet.
  std::optional<cursorctl::schema::history_record_t> last() const {
    auto prefix = cursorctl::schema::key::make_history_prefix();
    auto entry =
        storage_.last_by_prefix(cursorctl::schema::make_bytes_view(prefix));
    if (!entry) {
      return std::nullopt;
    }
    return decode_record(entry->first, entry->second);
  }

  /// All records in ascending id order.
  std::vector<cursorctl::schema::history_record_t> list() const {
    return list([](cursorctl::schema::action_type_t) { return true; });
  }

  /// Records whose action satisfies `filter`, in ascending id order.
  std::vector<cursorctl::schema::history_record_t> list(
      const action_filter_t& filter) const {
    auto prefix = cursorctl::schema::key::make_history_prefix();
    auto rows =
        storage_.list_by_prefix(cursorctl::schema::make_bytes_view(prefix));

    auto records = std::vector<cursorctl::schema::history_record_t>{};
    records.reserve(rows.size());
    for (const auto& [key, value] : rows) {
      auto record = decode_record(key, value);
      if (filter(record.action)) {
        records.push_back(std::move(record));
      }
    }
    return records;
  }

  std::size_t size() const {
    auto prefix = cursorctl::schema::key::make_history_prefix();
    return storage_.list_by_prefix(cursorctl::schema::make_bytes_view(prefix))
        .size();
  }

 private:
  cursorctl::schema::history_record_t decode_record(
      const cursorctl::schema::bytes_t& key,
      const cursorctl::schema::bytes_t& value) const {
    auto decoded = encoder_.template try_decode<
        cursorctl::schema::history_record_t>(
        cursorctl::schema::make_bytes_view(value));
    if (!decoded) {
      auto id = cursorctl::schema::key::parse_history_key(
          cursorctl::schema::make_bytes_view(key));
      spdlog::error("Failed decoding history record {}", id.value_or(0));
      throw cursorctl::common::storage_error{"corrupt history record"};
    }
    return *decoded;
  }

  cursorctl::storage::storage<Library>& storage_;
  mutable encoder_t encoder_;
};

}  // namespace cursorctl::history
