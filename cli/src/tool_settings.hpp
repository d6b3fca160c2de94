#pragma once

#include <string>
#include <vector>

#include <spdlog/common.h>

#include "planid/core/log.hpp"

namespace planid::cli {

constexpr const char* kToolSettingsFile = "planid.cfg";

struct ToolSettings {
  planid::core::log::LogSettings log{};
  std::string session_id{};  // Empty: mint a fresh session.
  bool pretty = false;       // Block-style YAML output instead of JSON.
};

struct SettingsLoadReport {
  bool file_found = false;
  std::vector<std::string> warnings{};
};

bool parse_bool(const std::string& value, bool fallback);

// Applies one key=value line. Returns false and fills warning for unknown keys
// or values that do not parse; settings keep their previous values then.
bool apply_setting_line(const std::string& line, ToolSettings* settings, std::string* warning);

ToolSettings LoadToolSettings(const std::string& path, SettingsLoadReport* report);

}  // namespace planid::cli
