#pragma once

#include <cursorctl/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema key type: history keys.
// Canonical keys for history rows and the history id sequence. Ids are
// written big-endian so the store's byte order is id order.
namespace cursorctl::schema::key {

inline constexpr std::string_view kHistoryPrefix{"SYS|HISTORY|ACTION|"};
inline constexpr std::string_view kHistorySequenceKey{
    "SYS|STATE|HISTORY_SEQ|NEXT"};

cursorctl::schema::bytes_t make_history_key(uint64_t id);
cursorctl::schema::bytes_t make_history_prefix();
cursorctl::schema::bytes_t make_history_sequence_key();

std::optional<uint64_t> parse_history_key(
    const cursorctl::schema::bytes_view_t& key);

}  // namespace cursorctl::schema::key
