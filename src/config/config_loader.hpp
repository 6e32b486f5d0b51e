#pragma once

#include <filesystem>
#include <string>

#include "config/config_schema.hpp"

namespace remindbot::config {

std::filesystem::path GetHomePath();
std::filesystem::path GetConfigPath();

// Expands a leading "~/" against $HOME.
std::string ExpandHome(const std::string& path);

// Reads ~/.remindbot/config.json, then applies REMINDBOT_* environment overrides.
Config LoadConfig();
Config LoadConfig(const std::filesystem::path& config_path);

}  // namespace remindbot::config
