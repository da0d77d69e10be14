#pragma once

#include <stdexcept>

namespace cursorctl::common {

/// History database could not be opened, read or written.
struct storage_error final : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

/// The target application's configuration location could not be reached.
struct target_write_error final : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

/// Caller supplied something the domain does not know (e.g. a slot name).
struct validation_error final : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

}  // namespace cursorctl::common
