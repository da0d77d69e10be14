#include <cursorctl/common/errors.hpp>
#include <cursorctl/target/storage_json_target.hpp>

#include <json/json.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <memory>
#include <system_error>
#include <utility>

namespace cursorctl::target {

namespace {

[[noreturn]] void fail(const std::string& what) {
  spdlog::error("{}", what);
  throw cursorctl::common::target_write_error{what};
}

void create_parent_directories(const std::filesystem::path& path) {
  auto parent = path.parent_path();
  if (parent.empty()) {
    return;
  }
  auto error = std::error_code{};
  std::filesystem::create_directories(parent, error);
  if (error) {
    fail("cannot create directory " + parent.string() + ": " +
         error.message());
  }
}

void remove_entry(const std::filesystem::path& path) {
  auto error = std::error_code{};
  auto status = std::filesystem::symlink_status(path, error);
  if (error && error != std::errc::no_such_file_or_directory) {
    fail("cannot inspect " + path.string() + ": " + error.message());
  }
  if (!std::filesystem::exists(status)) {
    return;
  }
  if (std::filesystem::is_directory(status)) {
    std::filesystem::remove_all(path, error);
  } else {
    std::filesystem::remove(path, error);
  }
  if (error) {
    fail("cannot remove " + path.string() + ": " + error.message());
  }
}

}  // namespace

storage_json_target::storage_json_target(std::filesystem::path storage_json,
                                         std::filesystem::path updater_path)
    : storage_json_{std::move(storage_json)},
      updater_path_{std::move(updater_path)} {}

void storage_json_target::write_identifier(
    const cursorctl::schema::identifier_slot_t slot,
    const std::string& value) {
  auto root = load();
  root[std::string{cursorctl::schema::storage_key(slot)}] = value;
  save(root);
  spdlog::info("Wrote {} to {}", cursorctl::schema::storage_key(slot),
               storage_json_.string());
}

std::map<cursorctl::schema::identifier_slot_t, std::string>
storage_json_target::read_identifiers() const {
  auto root = load();
  auto identifiers =
      std::map<cursorctl::schema::identifier_slot_t, std::string>{};
  for (const auto slot : cursorctl::schema::kIdentifierSlots) {
    const auto key = std::string{cursorctl::schema::storage_key(slot)};
    if (root.isMember(key) && root[key].isString()) {
      identifiers.emplace(slot, root[key].asString());
    }
  }
  return identifiers;
}

void storage_json_target::set_update_capability(const bool enabled) {
  remove_entry(updater_path_);
  if (enabled) {
    auto error = std::error_code{};
    std::filesystem::create_directories(updater_path_, error);
    if (error) {
      fail("cannot create updater directory " + updater_path_.string() +
           ": " + error.message());
    }
  } else {
    create_parent_directories(updater_path_);
    auto blocker = std::ofstream{updater_path_, std::ios::trunc};
    if (!blocker) {
      fail("cannot create updater blocker " + updater_path_.string());
    }
  }
  spdlog::info("Updates {} via {}", enabled ? "enabled" : "blocked",
               updater_path_.string());
}

bool storage_json_target::update_capability() const {
  auto error = std::error_code{};
  auto status = std::filesystem::symlink_status(updater_path_, error);
  if (error && error != std::errc::no_such_file_or_directory) {
    fail("cannot inspect " + updater_path_.string() + ": " + error.message());
  }
  return !std::filesystem::is_regular_file(status);
}

Json::Value storage_json_target::load() const {
  auto error = std::error_code{};
  if (!std::filesystem::exists(storage_json_, error)) {
    if (error) {
      fail("cannot inspect " + storage_json_.string() + ": " +
           error.message());
    }
    return Json::Value{Json::objectValue};
  }

  auto input = std::ifstream{storage_json_};
  if (!input) {
    fail("cannot open " + storage_json_.string() + " for reading");
  }

  auto builder = Json::CharReaderBuilder{};
  auto root = Json::Value{};
  auto errors = std::string{};
  try {
    if (!Json::parseFromStream(builder, input, &root, &errors)) {
      fail(storage_json_.string() + " is not valid JSON: " + errors);
    }
  } catch (const Json::Exception& ex) {
    fail(storage_json_.string() + " is not valid JSON: " + ex.what());
  }
  if (root.isNull()) {
    return Json::Value{Json::objectValue};
  }
  if (!root.isObject()) {
    fail(storage_json_.string() + " does not contain a JSON object");
  }
  return root;
}

void storage_json_target::save(const Json::Value& root) const {
  create_parent_directories(storage_json_);

  auto builder = Json::StreamWriterBuilder{};
  builder["indentation"] = "  ";
  auto writer = std::unique_ptr<Json::StreamWriter>(builder.newStreamWriter());

  auto staged = storage_json_;
  staged += ".tmp";
  {
    auto output = std::ofstream{staged, std::ios::trunc};
    if (!output) {
      fail("cannot open " + staged.string() + " for writing");
    }
    writer->write(root, &output);
    output << '\n';
    output.flush();
    if (!output) {
      fail("failed writing " + staged.string());
    }
  }

  auto error = std::error_code{};
  std::filesystem::rename(staged, storage_json_, error);
  if (error) {
    auto cleanup = std::error_code{};
    std::filesystem::remove(staged, cleanup);
    fail("cannot replace " + storage_json_.string() + ": " + error.message());
  }
}

}  // namespace cursorctl::target
