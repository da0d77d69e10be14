#pragma once

#include <string>
#include <string_view>

namespace cursorctl::notify {

/// Fire-and-forget desktop notification. Implementations may throw; callers
/// must not let a failure here change an action's outcome.
class notification_sink {
 public:
  virtual ~notification_sink() = default;
  virtual void notify(std::string_view title, std::string_view message) = 0;
};

/// Writes notifications to the log only.
class log_notification_sink final : public notification_sink {
 public:
  void notify(std::string_view title, std::string_view message) override;
};

/// Runs `<program> <title> <message>`, `notify-send` by default.
class command_notification_sink final : public notification_sink {
 public:
  explicit command_notification_sink(std::string program = "notify-send");

  /// Throws std::runtime_error when the program cannot be started or exits
  /// unsuccessfully.
  void notify(std::string_view title, std::string_view message) override;

 private:
  std::string program_;
};

}  // namespace cursorctl::notify
