#pragma once

#include <cstdint>

namespace cursorctl::schema {

enum class action_error_code : uint32_t {
  storage_failure = 1,
  target_write_failed = 2,
  invalid_slot = 3,
};

}  // namespace cursorctl::schema
