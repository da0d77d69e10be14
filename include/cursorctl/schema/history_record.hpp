#pragma once

#include <cursorctl/schema/action_type.hpp>
#include <cursorctl/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: history record.
// Append-only audit row for one completed user action. `value` is set only
// for identifier regenerations.
namespace cursorctl::schema {

template <uint16_t Version>
struct history_record;

template <>
struct history_record<1> final {
  uint16_t version{1};
  uint64_t id{};
  action_type_t action{};
  std::optional<std::string> value;
  timestamp_milliseconds_t recorded_at{};
};

using history_record_t = history_record<1>;

}  // namespace cursorctl::schema
