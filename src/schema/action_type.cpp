#include <cursorctl/common/critical.hpp>
#include <cursorctl/schema/action_type.hpp>
#include <cursorctl/schema/identifier_slot.hpp>

namespace cursorctl::schema {

std::string_view to_string(const action_type_t action) {
  auto name = to_string(action, kActionTypeNames);
  if (!name) {
    cursorctl::common::critical("action type has no name mapping");
  }
  return *name;
}

bool is_identifier_action(const action_type_t action) {
  return to_identifier_slot(action).has_value();
}

template <>
std::optional<action_type_t> try_from_string<action_type_t>(
    const std::string_view value) {
  return from_string(value, kActionTypeNames);
}

std::string_view to_string(const identifier_slot_t slot) {
  auto name = to_string(slot, kIdentifierSlotNames);
  if (!name) {
    cursorctl::common::critical("identifier slot has no name mapping");
  }
  return *name;
}

std::string_view storage_key(const identifier_slot_t slot) {
  auto key = to_string(slot, kIdentifierSlotStorageKeys);
  if (!key) {
    cursorctl::common::critical("identifier slot has no storage key");
  }
  return *key;
}

action_type_t to_action_type(const identifier_slot_t slot) {
  switch (slot) {
    case identifier_slot_t::machine_id:
      return action_type_t::machine_id;
    case identifier_slot_t::mac_machine_id:
      return action_type_t::mac_machine_id;
    case identifier_slot_t::device_id:
      return action_type_t::device_id;
    case identifier_slot_t::sqm_id:
      return action_type_t::sqm_id;
  }
  cursorctl::common::critical("unknown identifier slot");
}

std::optional<identifier_slot_t> to_identifier_slot(
    const action_type_t action) {
  switch (action) {
    case action_type_t::machine_id:
      return identifier_slot_t::machine_id;
    case action_type_t::mac_machine_id:
      return identifier_slot_t::mac_machine_id;
    case action_type_t::device_id:
      return identifier_slot_t::device_id;
    case action_type_t::sqm_id:
      return identifier_slot_t::sqm_id;
    case action_type_t::update_block:
    case action_type_t::update_unblock:
      return std::nullopt;
  }
  return std::nullopt;
}

template <>
std::optional<identifier_slot_t> try_from_string<identifier_slot_t>(
    const std::string_view value) {
  return from_string(value, kIdentifierSlotNames);
}

}  // namespace cursorctl::schema
