#pragma once

#include <spdlog/spdlog.h>
#include <cursorctl/common/errors.hpp>
#include <cursorctl/history/store.hpp>
#include <cursorctl/identity/generator.hpp>
#include <cursorctl/notify/notification_sink.hpp>
#include <cursorctl/schema/action_result.hpp>
#include <cursorctl/schema/history_record.hpp>
#include <cursorctl/schema/identifier_slot.hpp>
#include <cursorctl/storage/rocksdb/storage.hpp>
#include <cursorctl/target/config_target.hpp>
#include <exception>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cursorctl::manager {

namespace detail {

inline constexpr auto kHistoryCodespace = std::string_view{"history"};
inline constexpr auto kTargetCodespace = std::string_view{"target"};
inline constexpr auto kIdentityCodespace = std::string_view{"identity"};

inline constexpr auto kUpdateTitle = std::string_view{"Cursor update control"};
inline constexpr auto kIdentifierTitle =
    std::string_view{"Cursor identifier change"};

}  // namespace detail

/// Runs user actions against the target configuration and records them.
///
/// Each action performs its effect first, then appends exactly one history
/// record, then attempts a notification. Failures are caught at the action
/// boundary and reported in the returned result; they never escape.
template <typename Library>
class manager final {
 public:
  using history_store_t = cursorctl::history::store<Library>;

  /// `notifier` may be null to disable notifications.
  manager(history_store_t& history,
          cursorctl::target::config_target& target,
          cursorctl::identity::generator generator = {},
          cursorctl::notify::notification_sink* notifier = nullptr)
      : history_{history},
        target_{target},
        generator_{std::move(generator)},
        notifier_{notifier} {}

  /// Regenerate the slot named `slot_name` and write it to the target.
  cursorctl::schema::action_result_t regenerate(
      const std::string_view slot_name) {
    auto slot = cursorctl::identity::generator::parse_slot(slot_name);
    if (!slot) {
      spdlog::warn("Rejected unknown identifier slot '{}'", slot_name);
      return cursorctl::schema::make_error_result(
          cursorctl::schema::action_error_code::invalid_slot,
          std::string{detail::kIdentityCodespace},
          "unknown identifier slot '" + std::string{slot_name} + "'");
    }
    return regenerate(*slot);
  }

  cursorctl::schema::action_result_t regenerate(
      const cursorctl::schema::identifier_slot_t slot) {
    auto value = generator_.generate(slot);
    try {
      target_.write_identifier(slot, value);
    } catch (const cursorctl::common::target_write_error& ex) {
      spdlog::error("Failed to write {}: {}", cursorctl::schema::to_string(slot),
                    ex.what());
      return cursorctl::schema::make_error_result(
          cursorctl::schema::action_error_code::target_write_failed,
          std::string{detail::kTargetCodespace}, ex.what());
    }

    auto result = record(cursorctl::schema::to_action_type(slot), value);
    if (cursorctl::schema::succeeded(result)) {
      notify(detail::kIdentifierTitle,
             std::string{cursorctl::schema::to_string(slot)} + " regenerated");
    }
    return result;
  }

  /// Regenerate every slot in kIdentifierSlots order, one record per slot.
  std::vector<cursorctl::schema::action_result_t> regenerate_all() {
    auto results = std::vector<cursorctl::schema::action_result_t>{};
    results.reserve(cursorctl::schema::kIdentifierSlots.size());
    for (const auto slot : cursorctl::schema::kIdentifierSlots) {
      results.push_back(regenerate(slot));
    }
    return results;
  }

  /// Block or unblock update checks. Repeating a call is a no-op on the
  /// target but still appends a record.
  cursorctl::schema::action_result_t set_update_blocked(const bool blocked) {
    try {
      target_.set_update_capability(!blocked);
    } catch (const cursorctl::common::target_write_error& ex) {
      spdlog::error("Failed to {} updates: {}", blocked ? "block" : "unblock",
                    ex.what());
      return cursorctl::schema::make_error_result(
          cursorctl::schema::action_error_code::target_write_failed,
          std::string{detail::kTargetCodespace}, ex.what());
    }

    auto result = record(blocked ? cursorctl::schema::action_type_t::update_block
                                 : cursorctl::schema::action_type_t::update_unblock,
                         std::nullopt);
    if (cursorctl::schema::succeeded(result)) {
      notify(detail::kUpdateTitle,
             blocked ? "Updates blocked." : "Updates enabled.");
    }
    return result;
  }

  /// Reads below propagate storage_error / target_write_error.
  bool updates_blocked() const { return !target_.update_capability(); }

  std::optional<cursorctl::schema::history_record_t> last_action() const {
    return history_.last();
  }

  std::vector<cursorctl::schema::history_record_t> history() const {
    return history_.list();
  }

  std::vector<cursorctl::schema::history_record_t> identifier_history() const {
    return history_.list(cursorctl::schema::is_identifier_action);
  }

  std::map<cursorctl::schema::identifier_slot_t, std::string>
  current_identifiers() const {
    return target_.read_identifiers();
  }

 private:
  cursorctl::schema::action_result_t record(
      const cursorctl::schema::action_type_t action,
      std::optional<std::string> value) {
    try {
      auto stored = history_.append(cursorctl::schema::history_record_t{
          .action = action,
          .value = std::move(value),
          .recorded_at = cursorctl::schema::now_milliseconds()});
      spdlog::info("Recorded {} as history #{}",
                   cursorctl::schema::to_string(action), stored.id);
      return cursorctl::schema::action_result_t{.log = "ok",
                                                .record = std::move(stored)};
    } catch (const cursorctl::common::storage_error& ex) {
      // The target already carries the new state; only the audit row is lost.
      spdlog::error("Failed to record {}: {}",
                    cursorctl::schema::to_string(action), ex.what());
      return cursorctl::schema::make_error_result(
          cursorctl::schema::action_error_code::storage_failure,
          std::string{detail::kHistoryCodespace}, ex.what());
    }
  }

  void notify(const std::string_view title,
              const std::string_view message) const {
    if (notifier_ == nullptr) {
      return;
    }
    try {
      notifier_->notify(title, message);
    } catch (const std::exception& ex) {
      spdlog::warn("Notification '{}' failed: {}", title, ex.what());
    }
  }

  history_store_t& history_;
  cursorctl::target::config_target& target_;
  cursorctl::identity::generator generator_;
  cursorctl::notify::notification_sink* notifier_;
};

using manager_t = manager<cursorctl::storage::rocksdb_storage_tag>;

}  // namespace cursorctl::manager
