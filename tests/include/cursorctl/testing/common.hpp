#pragma once

#include <cursorctl/schema/history_record.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace cursorctl::testing {

inline std::string make_temp_path(const std::string_view prefix) {
  static auto counter = std::atomic<uint64_t>{};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)) +
                     "_" + std::to_string(counter++));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Removes its directory on destruction.
class temp_dir final {
 public:
  explicit temp_dir(const std::string_view prefix)
      : path_{make_temp_path(prefix)} {
    std::filesystem::create_directories(path_);
  }

  temp_dir(const temp_dir&) = delete;
  temp_dir& operator=(const temp_dir&) = delete;

  ~temp_dir() { remove_path(path_.string()); }

  const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
};

inline cursorctl::schema::history_record_t make_record(
    const cursorctl::schema::action_type_t action,
    std::optional<std::string> value = std::nullopt,
    const cursorctl::schema::timestamp_milliseconds_t recorded_at =
        1'700'000'000'000) {
  return cursorctl::schema::history_record_t{.action = action,
                                             .value = std::move(value),
                                             .recorded_at = recorded_at};
}

}  // namespace cursorctl::testing
