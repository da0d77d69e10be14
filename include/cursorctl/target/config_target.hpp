#pragma once

#include <cursorctl/schema/identifier_slot.hpp>
#include <map>
#include <string>

namespace cursorctl::target {

/// Configuration store owned by the managed application.
///
/// Implementations throw cursorctl::common::target_write_error when the
/// location cannot be read or written.
class config_target {
 public:
  virtual ~config_target() = default;

  virtual void write_identifier(cursorctl::schema::identifier_slot_t slot,
                                const std::string& value) = 0;

  /// Identifier values currently stored; slots without a value are absent.
  virtual std::map<cursorctl::schema::identifier_slot_t, std::string>
  read_identifiers() const = 0;

  virtual void set_update_capability(bool enabled) = 0;

  /// True when the application is able to check for updates.
  virtual bool update_capability() const = 0;
};

}  // namespace cursorctl::target
