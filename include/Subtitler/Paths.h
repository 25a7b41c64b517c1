#pragma once
#include <filesystem>
#include <string>

namespace Subtitler {

// Empty when the variable is unset.
std::string GetEnv(const char* name);
// Case-insensitive comparison of an environment variable's value.
bool EnvEquals(const char* name, const std::string& value);

// SUBTITLER_CONFIG_PATH, else the per-user config directory. Seeds the file from
// ./config.sample.json when the default location has no settings yet.
std::filesystem::path GetConfigurationPath();

std::filesystem::path GetLogDirectory(const std::filesystem::path& configPath);

}
