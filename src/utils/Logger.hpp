#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace sten {

/**
 * @brief Logging configuration shared by every module logger.
 */
struct LogConfig {
  spdlog::level::level_enum level = spdlog::level::info;
  std::string file = "logs/sten.log"; ///< Empty disables the file sink
  bool console = true;                ///< Mirror records to stderr
};

/**
 * @brief Rebuilds the shared sinks and applies them to all module loggers.
 *
 * Falls back to stderr only when the log file cannot be opened.
 * @param config The logging configuration.
 */
void initLogging(const LogConfig &config);

/**
 * @brief Gets (or creates) the named logger of a module.
 * @param name Module name shown in every record.
 * @return A logger writing to the shared sinks.
 */
std::shared_ptr<spdlog::logger> moduleLogger(const std::string &name);

} // namespace sten
