#pragma once

#include <spdlog/logger.h>

#include <filesystem>
#include <memory>

#include "change_sink.hpp"

// Append-only change log. Every entry is written to the log file and,
// when echo is enabled, to standard output:
//   19/Oct/2026 14:03:07 [ CREATED ] /data/replica/docs
class ChangeLog : public ChangeSink {
public:
  explicit ChangeLog(const std::filesystem::path& log_file, bool echo = true);
  ~ChangeLog() override;

  void emit(ChangeAction action, const std::filesystem::path& path) override;

  const std::filesystem::path& log_file() const { return log_file_; }

private:
  std::filesystem::path log_file_;
  std::shared_ptr<spdlog::logger> logger_;
};
