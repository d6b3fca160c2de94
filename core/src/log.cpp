#include "planid/core/log.hpp"

#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace planid::core::log {

namespace {

constexpr const char* kLoggerName = "planid";

std::mutex g_logger_mutex;
std::shared_ptr<spdlog::logger> g_logger;

std::shared_ptr<spdlog::logger> make_logger(const LogSettings& settings) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!settings.file_path.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(settings.file_path, false));
  }
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_level(settings.level);
  logger->set_pattern(settings.pattern);
  logger->flush_on(spdlog::level::warn);
  return logger;
}

}  // namespace

void init(const LogSettings& settings) {
  auto logger = make_logger(settings);
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  g_logger = std::move(logger);
}

std::shared_ptr<spdlog::logger> get() {
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  if (!g_logger) {
    g_logger = make_logger(LogSettings{});
  }
  return g_logger;
}

}  // namespace planid::core::log
