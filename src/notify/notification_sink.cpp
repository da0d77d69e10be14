#include <cursorctl/notify/notification_sink.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <utility>
#include <vector>

#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>

extern char** environ;

namespace cursorctl::notify {

void log_notification_sink::notify(const std::string_view title,
                                   const std::string_view message) {
  spdlog::info("[notify] {}: {}", title, message);
}

command_notification_sink::command_notification_sink(std::string program)
    : program_{std::move(program)} {}

void command_notification_sink::notify(const std::string_view title,
                                       const std::string_view message) {
  auto title_arg = std::string{title};
  auto message_arg = std::string{message};
  auto argv = std::vector<char*>{program_.data(), title_arg.data(),
                                 message_arg.data(), nullptr};

  pid_t pid{};
  auto spawn_status = posix_spawnp(&pid, program_.c_str(), nullptr, nullptr,
                                   argv.data(), environ);
  if (spawn_status != 0) {
    throw std::runtime_error{"cannot start " + program_ + ": " +
                             std::strerror(spawn_status)};
  }

  auto status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      throw std::runtime_error{"cannot wait for " + program_ + ": " +
                               std::strerror(errno)};
    }
  }
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    throw std::runtime_error{program_ + " exited unsuccessfully"};
  }
  spdlog::debug("Sent desktop notification '{}'", title);
}

}  // namespace cursorctl::notify
