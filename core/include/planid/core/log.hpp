#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace planid::core::log {

struct LogSettings {
  spdlog::level::level_enum level = spdlog::level::info;
  std::string file_path{};  // Empty: stderr only.
  std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";
};

// Replaces the shared "planid" logger. Safe to call more than once.
void init(const LogSettings& settings);

// Shared "planid" logger; created with default settings on first use.
std::shared_ptr<spdlog::logger> get();

}  // namespace planid::core::log
