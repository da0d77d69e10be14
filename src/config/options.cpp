#include <cursorctl/common/errors.hpp>
#include <cursorctl/config/options.hpp>

#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace cursorctl::config {

namespace {

namespace po = boost::program_options;

constexpr auto kMaxSlotBytes = std::size_t{1024};

std::filesystem::path home_directory() {
  const auto* home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') {
    return std::filesystem::current_path();
  }
  return std::filesystem::path{home};
}

std::filesystem::path xdg_directory(const char* variable,
                                    const std::filesystem::path& fallback) {
  const auto* value = std::getenv(variable);
  if (value == nullptr || *value == '\0') {
    return home_directory() / fallback;
  }
  return std::filesystem::path{value};
}

void validate_slot_bytes(const std::string_view name, const std::size_t bytes) {
  if (bytes == 0 || bytes > kMaxSlotBytes) {
    throw cursorctl::common::validation_error{
        "slot." + std::string{name} + ".bytes must be between 1 and " +
        std::to_string(kMaxSlotBytes)};
  }
}

}  // namespace

std::string default_db_path() {
  return (xdg_directory("XDG_DATA_HOME", ".local/share") / "cursorctl" /
          "history")
      .string();
}

std::string default_config_file() {
  return (xdg_directory("XDG_CONFIG_HOME", ".config") / "cursorctl" /
          "cursorctl.conf")
      .string();
}

std::string default_storage_json() {
  return (home_directory() / ".config" / "Cursor" / "storage.json").string();
}

std::string default_updater_path() {
  return (home_directory() / ".config" / "cursor-updater").string();
}

options parse_options(const int argc, const char* const* argv) {
  auto parsed = options{};

  auto generic = po::options_description{"cursorctl options"};
  generic.add_options()("help,h", "show help")(
      "config,c",
      po::value<std::string>(&parsed.config_file)
          ->default_value(default_config_file()),
      "config file (ignored when missing)")(
      "slot,s", po::value<std::vector<std::string>>(&parsed.slots),
      "slot to regenerate: machine_id|mac_machine_id|device_id|sqm_id "
      "(repeatable, default all)")("verbose,v", "enable debug logging");

  auto shared = po::options_description{"settings (also accepted in config)"};
  shared.add_options()(
      "db-path",
      po::value<std::string>(&parsed.db_path)->default_value(default_db_path()),
      "history database directory")(
      "storage-json",
      po::value<std::string>(&parsed.storage_json)
          ->default_value(default_storage_json()),
      "Cursor storage.json path")(
      "updater-path",
      po::value<std::string>(&parsed.updater_path)
          ->default_value(default_updater_path()),
      "Cursor updater directory path")(
      "log-file", po::value<std::string>(&parsed.log_file),
      "log file (default: cursorctl.log beside the database)")(
      "notify", po::value<bool>(&parsed.notify)->default_value(false),
      "send desktop notifications")(
      "slot.machine_id.bytes",
      po::value<std::size_t>(&parsed.generator.machine_id_bytes)
          ->default_value(parsed.generator.machine_id_bytes),
      "random bytes in machine_id")(
      "slot.mac_machine_id.bytes",
      po::value<std::size_t>(&parsed.generator.mac_machine_id_bytes)
          ->default_value(parsed.generator.mac_machine_id_bytes),
      "random bytes in mac_machine_id")(
      "slot.sqm_id.bytes",
      po::value<std::size_t>(&parsed.generator.sqm_id_bytes)
          ->default_value(parsed.generator.sqm_id_bytes),
      "random bytes in sqm_id");

  auto hidden = po::options_description{};
  hidden.add_options()("command", po::value<std::string>(&parsed.command));

  auto command_line = po::options_description{};
  command_line.add(generic).add(shared).add(hidden);

  auto visible = po::options_description{};
  visible.add(generic).add(shared);
  auto usage = std::ostringstream{};
  usage << "Usage: cursorctl <command> [options]\n"
        << "Commands: status | block | unblock | regenerate | identifiers | "
           "history\n"
        << visible;
  parsed.usage = usage.str();

  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(command_line)
                .positional(positional)
                .run(),
            vm);

  const auto config_path = vm["config"].as<std::string>();
  auto config_error = std::error_code{};
  const auto config_exists = std::filesystem::exists(config_path, config_error);
  if (config_error) {
    throw cursorctl::common::validation_error{"cannot inspect config file " +
                                              config_path + ": " +
                                              config_error.message()};
  }
  if (config_exists) {
    auto config_stream = std::ifstream{config_path};
    if (!config_stream) {
      throw cursorctl::common::validation_error{"cannot read config file " +
                                                config_path};
    }
    po::store(po::parse_config_file(config_stream, shared), vm);
    spdlog::debug("Loaded config file {}", config_path);
  } else if (!vm["config"].defaulted()) {
    throw cursorctl::common::validation_error{"config file " + config_path +
                                              " does not exist"};
  }
  po::notify(vm);

  parsed.help = vm.contains("help");
  parsed.verbose = vm.contains("verbose");
  if (parsed.help) {
    return parsed;
  }
  if (parsed.command.empty()) {
    throw cursorctl::common::validation_error{"missing command\n" +
                                              parsed.usage};
  }

  if (std::ranges::find(kCommands, parsed.command) == std::end(kCommands)) {
    throw cursorctl::common::validation_error{"unknown command '" +
                                              parsed.command + "'"};
  }
  if (!parsed.slots.empty() && parsed.command != "regenerate") {
    throw cursorctl::common::validation_error{
        "--slot is only valid with regenerate"};
  }
  validate_slot_bytes("machine_id", parsed.generator.machine_id_bytes);
  validate_slot_bytes("mac_machine_id", parsed.generator.mac_machine_id_bytes);
  validate_slot_bytes("sqm_id", parsed.generator.sqm_id_bytes);

  if (parsed.log_file.empty()) {
    parsed.log_file =
        (std::filesystem::path{parsed.db_path}.parent_path() / "cursorctl.log")
            .string();
  }
  return parsed;
}

}  // namespace cursorctl::config
