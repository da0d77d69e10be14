#pragma once

#include <cursorctl/schema/action_error_code.hpp>
#include <cursorctl/schema/history_record.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

// Schema type: action result.
// Outcome of one user action as reported back to the interface. `code` is 0
// on success, otherwise an action_error_code.
namespace cursorctl::schema {

template <uint16_t Version>
struct action_result;

template <>
struct action_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  std::optional<history_record_t> record;
};

using action_result_t = action_result<1>;

inline bool succeeded(const action_result_t& result) {
  return result.code == 0;
}

inline action_result_t make_error_result(const action_error_code code,
                                         std::string codespace,
                                         std::string log) {
  return action_result_t{.code = static_cast<uint32_t>(code),
                         .log = std::move(log),
                         .codespace = std::move(codespace)};
}

}  // namespace cursorctl::schema
