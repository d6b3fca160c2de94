#include "tool_settings.hpp"

#include <cstddef>
#include <fstream>
#include <string>

namespace planid::cli {

namespace {

std::string trim(const std::string& text) {
  const std::size_t first = text.find_first_not_of(" \t\r");
  if (first == std::string::npos) {
    return {};
  }
  const std::size_t last = text.find_last_not_of(" \t\r");
  return text.substr(first, last - first + 1);
}

}  // namespace

bool parse_bool(const std::string& value, bool fallback) {
  if (value == "1" || value == "true" || value == "True") {
    return true;
  }
  if (value == "0" || value == "false" || value == "False") {
    return false;
  }
  return fallback;
}

bool apply_setting_line(const std::string& line, ToolSettings* settings, std::string* warning) {
  const std::string stripped = trim(line);
  if (stripped.empty() || stripped.front() == '#') {
    return true;
  }
  const std::size_t eq = stripped.find('=');
  if (eq == std::string::npos || eq == 0) {
    *warning = "ignoring malformed line '" + stripped + "'";
    return false;
  }
  const std::string key = trim(stripped.substr(0, eq));
  const std::string value = trim(stripped.substr(eq + 1));

  if (key == "log_level") {
    const spdlog::level::level_enum level = spdlog::level::from_str(value);
    // from_str maps anything unknown to off; only accept an explicit "off".
    if (level == spdlog::level::off && value != "off") {
      *warning = "unknown log_level '" + value + "'";
      return false;
    }
    settings->log.level = level;
  } else if (key == "log_file") {
    settings->log.file_path = value;
  } else if (key == "log_pattern") {
    if (value.empty()) {
      *warning = "empty log_pattern";
      return false;
    }
    settings->log.pattern = value;
  } else if (key == "session_id") {
    settings->session_id = value;
  } else if (key == "pretty") {
    if (value != "1" && value != "0" && value != "true" && value != "false" && value != "True" &&
        value != "False") {
      *warning = "pretty expects a boolean, got '" + value + "'";
      return false;
    }
    settings->pretty = parse_bool(value, settings->pretty);
  } else {
    *warning = "unknown setting '" + key + "'";
    return false;
  }
  return true;
}

ToolSettings LoadToolSettings(const std::string& path, SettingsLoadReport* report) {
  ToolSettings settings{};
  std::ifstream ifs(path);
  if (!ifs.is_open()) {
    return settings;
  }
  report->file_found = true;

  std::string line;
  int line_number = 0;
  while (std::getline(ifs, line)) {
    ++line_number;
    std::string warning;
    if (!apply_setting_line(line, &settings, &warning)) {
      report->warnings.push_back(path + ":" + std::to_string(line_number) + ": " + warning);
    }
  }
  return settings;
}

}  // namespace planid::cli
