#pragma once

#include <cursorctl/schema/action_type.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(cursorctl::schema,
                             action_type_t,
                             cursorctl::schema::action_type_t::machine_id,
                             cursorctl::schema::action_type_t::mac_machine_id,
                             cursorctl::schema::action_type_t::device_id,
                             cursorctl::schema::action_type_t::sqm_id,
                             cursorctl::schema::action_type_t::update_block,
                             cursorctl::schema::action_type_t::update_unblock)
