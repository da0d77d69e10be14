#include <cursorctl/common/errors.hpp>
#include <cursorctl/config/options.hpp>
#include <cursorctl/testing/common.hpp>
#include <gtest/gtest.h>

#include <boost/program_options.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {

/// Points XDG lookups at a scratch directory for the test's lifetime.
class scoped_environment final {
 public:
  explicit scoped_environment(const std::filesystem::path& root) {
    ::setenv("HOME", root.c_str(), 1);
    ::setenv("XDG_CONFIG_HOME", (root / "config").c_str(), 1);
    ::setenv("XDG_DATA_HOME", (root / "data").c_str(), 1);
  }
  ~scoped_environment() {
    ::unsetenv("XDG_CONFIG_HOME");
    ::unsetenv("XDG_DATA_HOME");
  }
};

cursorctl::config::options parse(std::vector<std::string> args) {
  args.insert(std::begin(args), "cursorctl");
  auto argv = std::vector<const char*>{};
  for (const auto& arg : args) {
    argv.push_back(arg.c_str());
  }
  return cursorctl::config::parse_options(static_cast<int>(argv.size()),
                                          argv.data());
}

}  // namespace

TEST(config_options, defaults_follow_xdg_locations) {
  auto dir = cursorctl::testing::temp_dir{"cursorctl_config_defaults"};
  auto environment = scoped_environment{dir.path()};

  auto options = parse({"status"});
  EXPECT_EQ(options.command, "status");
  EXPECT_FALSE(options.help);
  EXPECT_EQ(options.db_path,
            (dir.path() / "data" / "cursorctl" / "history").string());
  EXPECT_EQ(options.storage_json,
            (dir.path() / ".config" / "Cursor" / "storage.json").string());
  EXPECT_EQ(options.updater_path,
            (dir.path() / ".config" / "cursor-updater").string());
  EXPECT_EQ(options.log_file,
            (dir.path() / "data" / "cursorctl" / "cursorctl.log").string());
  EXPECT_FALSE(options.notify);
  EXPECT_EQ(options.generator.machine_id_bytes, 32u);
  EXPECT_EQ(options.generator.sqm_id_bytes, 64u);
}

TEST(config_options, missing_command_is_a_usage_error) {
  auto dir = cursorctl::testing::temp_dir{"cursorctl_config_missing"};
  auto environment = scoped_environment{dir.path()};

  try {
    parse({});
    FAIL() << "expected validation_error";
  } catch (const cursorctl::common::validation_error& ex) {
    EXPECT_NE(std::string{ex.what()}.find("missing command"),
              std::string::npos);
    EXPECT_NE(std::string{ex.what()}.find("regenerate"), std::string::npos);
  }
}

TEST(config_options, help_flag_skips_command_validation) {
  auto dir = cursorctl::testing::temp_dir{"cursorctl_config_help"};
  auto environment = scoped_environment{dir.path()};

  auto options = parse({"--help"});
  EXPECT_TRUE(options.help);
  EXPECT_NE(options.usage.find("regenerate"), std::string::npos);
}

TEST(config_options, uninspectable_config_is_a_usage_error) {
  auto dir = cursorctl::testing::temp_dir{"cursorctl_config_uninspectable"};
  auto environment = scoped_environment{dir.path()};

  // A symlink loop fails the lookup with ELOOP instead of "not found".
  auto looped = dir.path() / "loop";
  std::filesystem::create_symlink(looped, looped);

  EXPECT_THROW(parse({"status", "--config", (looped / "cursorctl.conf").string()}),
               cursorctl::common::validation_error);
}

TEST(config_options, regenerate_accepts_repeated_slots) {
  auto dir = cursorctl::testing::temp_dir{"cursorctl_config_slots"};
  auto environment = scoped_environment{dir.path()};

  auto options =
      parse({"regenerate", "--slot", "machine_id", "-s", "sqm_id", "-v"});
  EXPECT_EQ(options.command, "regenerate");
  ASSERT_EQ(options.slots.size(), 2u);
  EXPECT_EQ(options.slots[0], "machine_id");
  EXPECT_EQ(options.slots[1], "sqm_id");
  EXPECT_TRUE(options.verbose);
}

TEST(config_options, rejects_invalid_usage) {
  auto dir = cursorctl::testing::temp_dir{"cursorctl_config_invalid"};
  auto environment = scoped_environment{dir.path()};

  EXPECT_THROW(parse({"reboot"}), cursorctl::common::validation_error);
  EXPECT_THROW(parse({"block", "--slot", "machine_id"}),
               cursorctl::common::validation_error);
  EXPECT_THROW(parse({"status", "--no-such-flag"}),
               boost::program_options::error);
  EXPECT_THROW(parse({"status", "--config", (dir.path() / "nope.conf").string()}),
               cursorctl::common::validation_error);
  EXPECT_THROW(parse({"regenerate", "--slot.sqm_id.bytes", "0"}),
               cursorctl::common::validation_error);
}

TEST(config_options, config_file_fills_settings_and_command_line_wins) {
  auto dir = cursorctl::testing::temp_dir{"cursorctl_config_file"};
  auto environment = scoped_environment{dir.path()};

  auto config_dir = dir.path() / "config" / "cursorctl";
  std::filesystem::create_directories(config_dir);
  {
    auto config = std::ofstream{config_dir / "cursorctl.conf"};
    config << "db-path = /srv/cursorctl/history\n"
           << "storage-json = /srv/cursor/storage.json\n"
           << "notify = true\n"
           << "[slot.machine_id]\n"
           << "bytes = 16\n";
  }

  auto options = parse({"history", "--storage-json", "/tmp/override.json"});
  EXPECT_EQ(options.db_path, "/srv/cursorctl/history");
  EXPECT_EQ(options.storage_json, "/tmp/override.json");
  EXPECT_TRUE(options.notify);
  EXPECT_EQ(options.generator.machine_id_bytes, 16u);
  EXPECT_EQ(options.log_file, "/srv/cursorctl/cursorctl.log");
}
