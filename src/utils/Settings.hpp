#pragma once

#include "Logger.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace sten {

namespace fs = std::filesystem;
using json = nlohmann::json;

/**
 * @struct Settings
 * @brief User preferences persisted as JSON.
 */
struct Settings {
  bool brute = false;                ///< Decode by trying every plan
  bool parallel_brute_force = true;  ///< Evaluate brute-force plans in parallel
  bool confirm_overwrite = true;     ///< Refuse to replace outputs without --force
  std::string cipher_key_mask = "*"; ///< Shown instead of key characters
  std::string prng_seed_mask = "*";  ///< Shown instead of seed characters
  std::string log_level = "info";    ///< spdlog level name
  std::string log_file = "logs/sten.log"; ///< Empty disables the log file

  /**
   * @brief Loads settings, falling back to defaults.
   *
   * A missing file yields defaults. Malformed content is logged and
   * replaced by defaults; absent keys keep their default values.
   * @param path The JSON file.
   */
  static Settings load(const fs::path &path);

  /**
   * @brief Writes the settings as pretty-printed JSON.
   * @throws std::runtime_error if the file cannot be written.
   */
  void save(const fs::path &path) const;

  /**
   * @brief Logging configuration derived from log_level and log_file.
   */
  LogConfig logConfig() const;

  std::string maskKey(std::string_view key) const;
  std::string maskSeed(std::string_view seed) const;
};

void to_json(json &j, const Settings &settings);
void from_json(const json &j, Settings &settings);

} // namespace sten
