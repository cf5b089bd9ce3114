#include "launch_config.hpp"

#include <cstdint>
#include <string>
#include <system_error>

#include "errors.hpp"
#include "settings_manager.hpp"
#include "utils.hpp"

namespace {

std::filesystem::path existing_path(const SettingsManager& settings, const char* key) {
  auto raw = settings.get<std::string>(key);
  if(raw.empty()) {
    throw ConfigError(std::string("No ") + key + " given");
  }
  auto path = normalize_root(raw);
  std::error_code ec;
  if(!std::filesystem::exists(path, ec)) {
    throw ConfigError("'" + path.string() + "' doesn't exist");
  }
  return path;
}

// True when inner is outer or lies somewhere below it.
bool nested_or_same(const std::filesystem::path& inner, const std::filesystem::path& outer) {
  auto relative = inner.lexically_relative(outer);
  if(relative.empty()) return false;
  return *relative.begin() != "..";
}

} // namespace

LaunchConfig resolve_launch_config(const SettingsManager& settings) {
  LaunchConfig config;
  config.source = existing_path(settings, "source");
  config.replica = existing_path(settings, "replica");
  config.log_file = existing_path(settings, "log_file");

  std::error_code ec;
  if(!std::filesystem::is_directory(config.source, ec)) {
    throw ConfigError("source '" + config.source.string() + "' is not a directory");
  }
  if(!std::filesystem::is_directory(config.replica, ec)) {
    throw ConfigError("replica '" + config.replica.string() + "' is not a directory");
  }

  if(nested_or_same(config.replica, config.source) || nested_or_same(config.source, config.replica)) {
    throw ConfigError("source and replica must be separate trees");
  }

  // The wait is armed on steady_clock, whose nanosecond ticks cap it at
  // roughly 292 years.
  constexpr auto max_interval = std::chrono::duration_cast<std::chrono::seconds>(
    std::chrono::steady_clock::duration::max()).count();
  const auto interval = settings.get<std::uint64_t>("interval");
  if(interval > static_cast<std::uint64_t>(max_interval)) {
    throw ConfigError("interval " + std::to_string(interval) + " is out of range (at most " +
                      std::to_string(max_interval) + " seconds)");
  }
  config.interval = std::chrono::seconds(static_cast<std::chrono::seconds::rep>(interval));
  config.verbose = settings.get<bool>("verbose");
  config.once = settings.get<bool>("once");
  return config;
}
