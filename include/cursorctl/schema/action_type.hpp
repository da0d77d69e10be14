#pragma once
#include <cursorctl/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Schema type: action type.
// Classifies a history record: one identifier slot regeneration or one
// update capability change.
namespace cursorctl::schema {

enum class action_type_t : uint8_t {
  machine_id = 0,
  mac_machine_id = 1,
  device_id = 2,
  sqm_id = 3,
  update_block = 4,
  update_unblock = 5
};

inline constexpr auto kActionTypeNames =
    std::array<std::pair<std::string_view, action_type_t>, 6>{{
        {"machine_id", action_type_t::machine_id},
        {"mac_machine_id", action_type_t::mac_machine_id},
        {"device_id", action_type_t::device_id},
        {"sqm_id", action_type_t::sqm_id},
        {"update_block", action_type_t::update_block},
        {"update_unblock", action_type_t::update_unblock},
    }};

std::string_view to_string(action_type_t action);

/// True for the four identifier regeneration actions.
bool is_identifier_action(action_type_t action);

template <>
std::optional<action_type_t> try_from_string<action_type_t>(
    const std::string_view value);

}  // namespace cursorctl::schema
