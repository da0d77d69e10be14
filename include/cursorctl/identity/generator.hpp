#pragma once

#include <cursorctl/schema/identifier_slot.hpp>
#include <cursorctl/schema/primitives.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace cursorctl::identity {

/// Random byte counts for the hex-formatted slots. `device_id` is always a
/// 16-byte version 4 UUID.
struct generator_options final {
  std::size_t machine_id_bytes{32};
  std::size_t mac_machine_id_bytes{64};
  std::size_t sqm_id_bytes{64};
};

/// Stateless source of fresh identifier values backed by OpenSSL's CSPRNG.
class generator final {
 public:
  generator() = default;
  explicit generator(generator_options options);

  /// Fresh value for `slot` in the slot's configured format.
  std::string generate(cursorctl::schema::identifier_slot_t slot) const;

  /// Fresh value for the slot named `slot_name`.
  ///
  /// Throws validation_error when the name is not a known slot.
  std::string generate(std::string_view slot_name) const;

  const generator_options& options() const { return options_; }

  static std::optional<cursorctl::schema::identifier_slot_t> parse_slot(
      std::string_view slot_name);

 private:
  generator_options options_{};
};

/// `count` bytes from OpenSSL's CSPRNG.
cursorctl::schema::bytes_t random_bytes(std::size_t count);

/// RFC 4122 version 4 UUID text for 16 random bytes.
std::string format_uuid_v4(cursorctl::schema::bytes_t bytes);

}  // namespace cursorctl::identity
