#pragma once

#include <cursorctl/target/config_target.hpp>
#include <filesystem>
#include <map>
#include <string>

namespace Json {
class Value;
}

namespace cursorctl::target {

/// Cursor's on-disk configuration.
///
/// Identifiers live as `telemetry.*` keys of the `storage.json` object.
/// Updates are blocked by placing a regular file where the updater expects
/// its `cursor-updater` directory; a directory (or nothing) means updates are
/// enabled.
class storage_json_target final : public config_target {
 public:
  storage_json_target(std::filesystem::path storage_json,
                      std::filesystem::path updater_path);

  void write_identifier(cursorctl::schema::identifier_slot_t slot,
                        const std::string& value) override;
  std::map<cursorctl::schema::identifier_slot_t, std::string>
  read_identifiers() const override;
  void set_update_capability(bool enabled) override;
  bool update_capability() const override;

  const std::filesystem::path& storage_json() const { return storage_json_; }
  const std::filesystem::path& updater_path() const { return updater_path_; }

 private:
  Json::Value load() const;
  void save(const Json::Value& root) const;

  std::filesystem::path storage_json_;
  std::filesystem::path updater_path_;
};

}  // namespace cursorctl::target
