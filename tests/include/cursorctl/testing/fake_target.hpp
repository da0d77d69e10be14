#pragma once

#include <cursorctl/common/errors.hpp>
#include <cursorctl/notify/notification_sink.hpp>
#include <cursorctl/target/config_target.hpp>

#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cursorctl::testing {

/// In-memory config_target with write-failure injection.
class fake_target final : public cursorctl::target::config_target {
 public:
  void write_identifier(const cursorctl::schema::identifier_slot_t slot,
                        const std::string& value) override {
    if (fail_writes) {
      throw cursorctl::common::target_write_error{"permission denied"};
    }
    identifiers[slot] = value;
  }

  std::map<cursorctl::schema::identifier_slot_t, std::string>
  read_identifiers() const override {
    return identifiers;
  }

  void set_update_capability(const bool enabled) override {
    if (fail_writes) {
      throw cursorctl::common::target_write_error{"permission denied"};
    }
    ++capability_writes;
    updates_enabled = enabled;
  }

  bool update_capability() const override { return updates_enabled; }

  std::map<cursorctl::schema::identifier_slot_t, std::string> identifiers;
  bool updates_enabled{true};
  bool fail_writes{false};
  std::size_t capability_writes{0};
};

/// Captures notifications, optionally throwing on each one.
class recording_sink final : public cursorctl::notify::notification_sink {
 public:
  void notify(const std::string_view title,
              const std::string_view message) override {
    sent.emplace_back(std::string{title}, std::string{message});
    if (fail) {
      throw std::runtime_error{"notification daemon unavailable"};
    }
  }

  std::vector<std::pair<std::string, std::string>> sent;
  bool fail{false};
};

}  // namespace cursorctl::testing
