#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

// A tree root (or an entry required to exist) is missing.
class NotFoundError : public std::runtime_error {
public:
  explicit NotFoundError(const std::filesystem::path& path)
    : std::runtime_error("path not found: " + path.string()),
      path_(path) {}

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

// Read, write, copy or remove failure on a single entry.
class IOError : public std::runtime_error {
public:
  IOError(const std::filesystem::path& path, const std::string& reason)
    : std::runtime_error(reason + ": " + path.string()),
      path_(path) {}

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

// Invalid launch arguments or settings.
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};
