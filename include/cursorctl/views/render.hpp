#pragma once

#include <cursorctl/schema/action_result.hpp>
#include <cursorctl/schema/history_record.hpp>
#include <cursorctl/schema/identifier_slot.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Text renderings of the two user-facing views.
namespace cursorctl::views {

/// `YYYY-MM-DD HH:MM:SS UTC`.
std::string render_timestamp(cursorctl::schema::timestamp_milliseconds_t at);

/// `#<id> <timestamp> <action>[ <value>]`.
std::string render_record(const cursorctl::schema::history_record_t& record);

std::string render_result(const cursorctl::schema::action_result_t& result);

/// Update Control: capability status line, then the last recorded action.
std::string render_update_control(
    bool updates_blocked,
    const std::optional<cursorctl::schema::history_record_t>& last);

/// Identifier Change: current values per slot, then identifier history
/// newest first.
std::string render_identifier_change(
    const std::map<cursorctl::schema::identifier_slot_t, std::string>& current,
    const std::vector<cursorctl::schema::history_record_t>& history);

/// Full history, oldest first.
std::string render_history(
    const std::vector<cursorctl::schema::history_record_t>& history);

}  // namespace cursorctl::views
