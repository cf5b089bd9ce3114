#pragma once

#include <chrono>
#include <filesystem>

class SettingsManager;

struct LaunchConfig {
  std::filesystem::path source;
  std::filesystem::path replica;
  std::filesystem::path log_file;
  std::chrono::seconds interval{0};
  bool verbose = false;
  bool once = false;
};

// Checks parsed settings before any cycle runs: source, replica and log file
// must all exist and the interval must fit a steady_clock wait. Throws
// ConfigError naming the first problem.
LaunchConfig resolve_launch_config(const SettingsManager& settings);
