#include "Logger.hpp"

#include <iostream>
#include <mutex>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace sten {

namespace {
constexpr const char *kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

std::mutex loggerMutex;
std::vector<spdlog::sink_ptr> sharedSinks;
// 未初始化前只输出警告及以上
spdlog::level::level_enum sharedLevel = spdlog::level::warn;

std::vector<spdlog::sink_ptr> &currentSinks() {
  if (sharedSinks.empty()) {
    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_pattern(kPattern);
    sharedSinks.push_back(std::move(console));
  }
  return sharedSinks;
}
} // namespace

void initLogging(const LogConfig &config) {
  std::vector<spdlog::sink_ptr> sinks;

  if (config.console) {
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }

  if (!config.file.empty()) {
    try {
      sinks.push_back(
          std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file));
    } catch (const spdlog::spdlog_ex &ex) {
      // Fallback to stderr if the file sink fails
      std::cerr << "Log initialization failed: " << ex.what() << std::endl;
      if (!config.console) {
        sinks.push_back(
            std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
      }
    }
  }

  for (auto &sink : sinks) {
    sink->set_pattern(kPattern);
  }

  std::lock_guard<std::mutex> lock(loggerMutex);
  sharedSinks = std::move(sinks);
  sharedLevel = config.level;

  spdlog::apply_all([&](const std::shared_ptr<spdlog::logger> &logger) {
    logger->sinks() = sharedSinks;
    logger->set_level(sharedLevel);
  });
}

std::shared_ptr<spdlog::logger> moduleLogger(const std::string &name) {
  std::lock_guard<std::mutex> lock(loggerMutex);
  if (auto existing = spdlog::get(name)) {
    return existing;
  }

  const auto &sinks = currentSinks();
  auto logger =
      std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
  logger->set_level(sharedLevel);
  logger->flush_on(spdlog::level::warn);
  spdlog::register_logger(logger);
  return logger;
}

} // namespace sten
