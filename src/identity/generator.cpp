#include <cursorctl/common/critical.hpp>
#include <cursorctl/common/errors.hpp>
#include <cursorctl/identity/generator.hpp>

#include <openssl/err.h>
#include <openssl/rand.h>

#include <limits>
#include <utility>

namespace cursorctl::identity {

generator::generator(generator_options options)
    : options_{std::move(options)} {}

std::string generator::generate(
    const cursorctl::schema::identifier_slot_t slot) const {
  switch (slot) {
    case cursorctl::schema::identifier_slot_t::machine_id:
      return cursorctl::schema::to_hex(random_bytes(options_.machine_id_bytes));
    case cursorctl::schema::identifier_slot_t::mac_machine_id:
      return cursorctl::schema::to_hex(
          random_bytes(options_.mac_machine_id_bytes));
    case cursorctl::schema::identifier_slot_t::device_id:
      return format_uuid_v4(random_bytes(16));
    case cursorctl::schema::identifier_slot_t::sqm_id:
      return cursorctl::schema::to_hex(random_bytes(options_.sqm_id_bytes));
  }
  cursorctl::common::critical("unknown identifier slot");
}

std::string generator::generate(const std::string_view slot_name) const {
  auto slot = parse_slot(slot_name);
  if (!slot) {
    throw cursorctl::common::validation_error{
        "unknown identifier slot '" + std::string{slot_name} + "'"};
  }
  return generate(*slot);
}

std::optional<cursorctl::schema::identifier_slot_t> generator::parse_slot(
    const std::string_view slot_name) {
  return cursorctl::schema::try_from_string<
      cursorctl::schema::identifier_slot_t>(slot_name);
}

cursorctl::schema::bytes_t random_bytes(const std::size_t count) {
  if (count > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    cursorctl::common::critical("random byte request too large");
  }
  auto out = cursorctl::schema::bytes_t(count);
  if (count == 0) {
    return out;
  }
  if (RAND_bytes(out.data(), static_cast<int>(count)) != 1) {
    spdlog::error("RAND_bytes failed: error {}", ERR_get_error());
    cursorctl::common::critical("OpenSSL CSPRNG failed");
  }
  return out;
}

std::string format_uuid_v4(cursorctl::schema::bytes_t bytes) {
  if (bytes.size() != 16) {
    cursorctl::common::critical("UUID requires exactly 16 bytes");
  }
  bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0Fu) | 0x40u);
  bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3Fu) | 0x80u);

  auto hex = cursorctl::schema::to_hex(bytes);
  auto out = std::string{};
  out.reserve(36);
  out.append(hex, 0, 8);
  out.push_back('-');
  out.append(hex, 8, 4);
  out.push_back('-');
  out.append(hex, 12, 4);
  out.push_back('-');
  out.append(hex, 16, 4);
  out.push_back('-');
  out.append(hex, 20, 12);
  return out;
}

}  // namespace cursorctl::identity
