#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <cursorctl/common/errors.hpp>
#include <cursorctl/config/options.hpp>
#include <cursorctl/history/store.hpp>
#include <cursorctl/manager/manager.hpp>
#include <cursorctl/notify/notification_sink.hpp>
#include <cursorctl/storage/rocksdb/storage.hpp>
#include <cursorctl/target/storage_json_target.hpp>
#include <cursorctl/views/render.hpp>

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace {

constexpr auto kExitOk = 0;
constexpr auto kExitActionFailed = 1;
constexpr auto kExitUsage = 2;

void init_logging(const cursorctl::config::options& options) {
  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console_sink->set_level(options.verbose ? spdlog::level::debug
                                          : spdlog::level::warn);
  auto sinks = std::vector<spdlog::sink_ptr>{console_sink};

  auto log_dir = std::filesystem::path{options.log_file}.parent_path();
  auto error = std::error_code{};
  if (!log_dir.empty()) {
    std::filesystem::create_directories(log_dir, error);
  }
  if (!error) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
          options.log_file, false));
    } catch (const spdlog::spdlog_ex& ex) {
      std::cerr << "cursorctl: file logging disabled: " << ex.what() << '\n';
    }
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "cursorctl", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(options.verbose ? spdlog::level::debug
                                    : spdlog::level::info);
}

int report(const std::vector<cursorctl::schema::action_result_t>& results) {
  auto exit_code = kExitOk;
  for (const auto& result : results) {
    std::cout << cursorctl::views::render_result(result) << '\n';
    if (!cursorctl::schema::succeeded(result)) {
      exit_code = kExitActionFailed;
    }
  }
  return exit_code;
}

int run(const cursorctl::config::options& options) {
  auto storage = cursorctl::storage::make_storage<
      cursorctl::storage::rocksdb_storage_tag>(options.db_path);
  auto history = cursorctl::manager::manager_t::history_store_t{storage};
  auto target = cursorctl::target::storage_json_target{options.storage_json,
                                                       options.updater_path};
  auto notifier = std::unique_ptr<cursorctl::notify::notification_sink>{};
  if (options.notify) {
    notifier = std::make_unique<cursorctl::notify::command_notification_sink>();
  }
  auto manager = cursorctl::manager::manager_t{
      history, target, cursorctl::identity::generator{options.generator},
      notifier.get()};

  const auto& command = options.command;
  if (command == "status") {
    std::cout << cursorctl::views::render_update_control(
        manager.updates_blocked(), manager.last_action());
    return kExitOk;
  }
  if (command == "block" || command == "unblock") {
    auto exit_code = report({manager.set_update_blocked(command == "block")});
    std::cout << cursorctl::views::render_update_control(
        manager.updates_blocked(), manager.last_action());
    return exit_code;
  }
  if (command == "regenerate") {
    auto results = std::vector<cursorctl::schema::action_result_t>{};
    if (options.slots.empty()) {
      results = manager.regenerate_all();
    } else {
      for (const auto& slot : options.slots) {
        results.push_back(manager.regenerate(slot));
      }
    }
    return report(results);
  }
  if (command == "identifiers") {
    std::cout << cursorctl::views::render_identifier_change(
        manager.current_identifiers(), manager.identifier_history());
    return kExitOk;
  }
  if (command == "history") {
    std::cout << cursorctl::views::render_history(manager.history());
    return kExitOk;
  }
  throw cursorctl::common::validation_error{"unknown command '" + command +
                                            "'"};
}

}  // namespace

int main(int argc, const char** argv) {
  auto options = cursorctl::config::options{};
  try {
    options = cursorctl::config::parse_options(argc, argv);
  } catch (const boost::program_options::error& ex) {
    std::cerr << "cursorctl: " << ex.what() << '\n';
    return kExitUsage;
  } catch (const cursorctl::common::validation_error& ex) {
    std::cerr << "cursorctl: " << ex.what() << '\n';
    return kExitUsage;
  }

  if (options.help) {
    std::cout << options.usage << '\n';
    return kExitOk;
  }

  init_logging(options);

  auto exit_code = kExitOk;
  try {
    exit_code = run(options);
  } catch (const cursorctl::common::storage_error& ex) {
    std::cerr << "cursorctl: history unavailable: " << ex.what() << '\n';
    exit_code = kExitActionFailed;
  } catch (const cursorctl::common::target_write_error& ex) {
    std::cerr << "cursorctl: Cursor configuration unavailable: " << ex.what()
              << '\n';
    exit_code = kExitActionFailed;
  } catch (const cursorctl::common::validation_error& ex) {
    std::cerr << "cursorctl: " << ex.what() << '\n';
    exit_code = kExitUsage;
  }

  spdlog::shutdown();
  return exit_code;
}
