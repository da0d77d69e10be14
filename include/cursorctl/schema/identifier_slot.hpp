#pragma once
#include <cursorctl/schema/action_type.hpp>
#include <cursorctl/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Schema type: identifier slot.
// Named telemetry identifier the target application keeps in its
// configuration and that can be regenerated.
namespace cursorctl::schema {

enum class identifier_slot_t : uint8_t {
  machine_id = 0,
  mac_machine_id = 1,
  device_id = 2,
  sqm_id = 3
};

/// Regeneration order used when every slot is regenerated at once.
inline constexpr auto kIdentifierSlots = std::array<identifier_slot_t, 4>{
    identifier_slot_t::machine_id, identifier_slot_t::mac_machine_id,
    identifier_slot_t::device_id, identifier_slot_t::sqm_id};

inline constexpr auto kIdentifierSlotNames =
    std::array<std::pair<std::string_view, identifier_slot_t>, 4>{{
        {"machine_id", identifier_slot_t::machine_id},
        {"mac_machine_id", identifier_slot_t::mac_machine_id},
        {"device_id", identifier_slot_t::device_id},
        {"sqm_id", identifier_slot_t::sqm_id},
    }};

inline constexpr auto kIdentifierSlotStorageKeys =
    std::array<std::pair<std::string_view, identifier_slot_t>, 4>{{
        {"telemetry.machineId", identifier_slot_t::machine_id},
        {"telemetry.macMachineId", identifier_slot_t::mac_machine_id},
        {"telemetry.devDeviceId", identifier_slot_t::device_id},
        {"telemetry.sqmId", identifier_slot_t::sqm_id},
    }};

std::string_view to_string(identifier_slot_t slot);

/// Key under which the target application stores the slot's value.
std::string_view storage_key(identifier_slot_t slot);

action_type_t to_action_type(identifier_slot_t slot);
std::optional<identifier_slot_t> to_identifier_slot(action_type_t action);

template <>
std::optional<identifier_slot_t> try_from_string<identifier_slot_t>(
    const std::string_view value);

}  // namespace cursorctl::schema
