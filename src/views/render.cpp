#include <cursorctl/views/render.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <ctime>
#include <iterator>

using namespace cursorctl::schema;

namespace cursorctl::views {

std::string render_timestamp(const timestamp_milliseconds_t at) {
  auto seconds = static_cast<std::time_t>(at / 1000);
  return fmt::format("{:%Y-%m-%d %H:%M:%S} UTC", fmt::gmtime(seconds));
}

std::string render_record(const history_record_t& record) {
  auto out = fmt::format("#{} {} {}", record.id,
                         render_timestamp(record.recorded_at),
                         to_string(record.action));
  if (record.value) {
    out += ' ';
    out += *record.value;
  }
  return out;
}

std::string render_result(const action_result_t& result) {
  if (succeeded(result)) {
    if (result.record) {
      return "OK: " + render_record(*result.record);
    }
    return "OK";
  }
  return fmt::format("FAILED [{}:{}]: {}", result.codespace, result.code,
                     result.log);
}

std::string render_update_control(
    const bool updates_blocked,
    const std::optional<history_record_t>& last) {
  auto out = std::string{updates_blocked ? "Updates blocked\n"
                                         : "Updates enabled\n"};
  if (last) {
    out += "Last action: " + render_record(*last) + '\n';
  } else {
    out += "No actions recorded yet\n";
  }
  return out;
}

std::string render_identifier_change(
    const std::map<identifier_slot_t, std::string>& current,
    const std::vector<history_record_t>& history) {
  auto out = std::string{"Current identifiers:\n"};
  for (const auto slot : kIdentifierSlots) {
    auto found = current.find(slot);
    out += fmt::format("  {}: {}\n", to_string(slot),
                       found == std::end(current) ? "(unset)" : found->second);
  }

  out += "History:\n";
  if (history.empty()) {
    out += "  No identifiers changed yet\n";
    return out;
  }
  for (auto it = std::rbegin(history); it != std::rend(history); ++it) {
    out += "  " + render_record(*it) + '\n';
  }
  return out;
}

std::string render_history(const std::vector<history_record_t>& history) {
  if (history.empty()) {
    return "No actions recorded yet\n";
  }
  auto out = std::string{};
  for (const auto& record : history) {
    out += render_record(record) + '\n';
  }
  return out;
}

}  // namespace cursorctl::views
