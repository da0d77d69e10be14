#pragma once

#include <cursorctl/identity/generator.hpp>
#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace cursorctl::config {

/// Runtime settings merged from the command line and the optional config
/// file; the command line wins.
struct options final {
  std::string command;
  std::vector<std::string> slots;
  std::string config_file;
  std::string db_path;
  std::string storage_json;
  std::string updater_path;
  std::string log_file;
  bool notify{false};
  bool verbose{false};
  bool help{false};
  cursorctl::identity::generator_options generator;
  std::string usage;
};

inline constexpr auto kCommands = std::array<std::string_view, 6>{
    "status", "block", "unblock", "regenerate", "identifiers", "history"};

/// Parse argv (and the config file it names, if present).
///
/// Throws boost::program_options::error on malformed input and
/// cursorctl::common::validation_error on values the domain rejects.
options parse_options(int argc, const char* const* argv);

/// `$XDG_DATA_HOME/cursorctl/history`, or `~/.local/share/...`.
std::string default_db_path();
/// `$XDG_CONFIG_HOME/cursorctl/cursorctl.conf`, or `~/.config/...`.
std::string default_config_file();
/// `~/.config/Cursor/storage.json`.
std::string default_storage_json();
/// `~/.config/cursor-updater`.
std::string default_updater_path();

}  // namespace cursorctl::config
