#include "Settings.hpp"

#include <fstream>
#include <stdexcept>

namespace sten {

namespace {
std::string mask(std::string_view secret, const std::string &maskChar) {
  if (maskChar.empty()) {
    return std::string(secret);
  }
  return std::string(secret.size(), maskChar.front());
}
} // namespace

void to_json(json &j, const Settings &settings) {
  j = json{{"brute", settings.brute},
           {"parallelBruteForce", settings.parallel_brute_force},
           {"confirmOverwrite", settings.confirm_overwrite},
           {"cipherKeyMask", settings.cipher_key_mask},
           {"prngSeedMask", settings.prng_seed_mask},
           {"logLevel", settings.log_level},
           {"logFile", settings.log_file}};
}

void from_json(const json &j, Settings &settings) {
  const Settings defaults;
  settings.brute = j.value("brute", defaults.brute);
  settings.parallel_brute_force =
      j.value("parallelBruteForce", defaults.parallel_brute_force);
  settings.confirm_overwrite =
      j.value("confirmOverwrite", defaults.confirm_overwrite);
  settings.cipher_key_mask = j.value("cipherKeyMask", defaults.cipher_key_mask);
  settings.prng_seed_mask = j.value("prngSeedMask", defaults.prng_seed_mask);
  settings.log_level = j.value("logLevel", defaults.log_level);
  settings.log_file = j.value("logFile", defaults.log_file);
}

Settings Settings::load(const fs::path &path) {
  auto logger = moduleLogger("Settings");

  std::ifstream file(path);
  if (!file.is_open()) {
    logger->debug("No settings at {}, using defaults", path.string());
    return {};
  }

  try {
    const json j = json::parse(file);
    if (!j.is_object()) {
      logger->warn("Settings file {} is not a JSON object, using defaults",
                   path.string());
      return {};
    }
    return j.get<Settings>();
  } catch (const json::exception &e) {
    logger->warn("Cannot read settings {}: {}", path.string(), e.what());
    return {};
  }
}

void Settings::save(const fs::path &path) const {
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path());
  }

  std::ofstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot write settings to " + path.string());
  }
  file << json(*this).dump(2) << '\n';
}

LogConfig Settings::logConfig() const {
  LogConfig config;
  config.file = log_file;
  config.level = spdlog::level::from_str(log_level);
  // from_str 对未知名称返回 off
  if (config.level == spdlog::level::off && log_level != "off") {
    config.level = spdlog::level::info;
  }
  return config;
}

std::string Settings::maskKey(std::string_view key) const {
  return mask(key, cipher_key_mask);
}

std::string Settings::maskSeed(std::string_view seed) const {
  return mask(seed, prng_seed_mask);
}

} // namespace sten
