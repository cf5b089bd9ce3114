#include "change_log.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <vector>

namespace {
constexpr const char* kChangePattern = "%d/%b/%Y %H:%M:%S %v";
} // namespace

const char* to_string(ChangeAction action) {
  switch(action) {
    case ChangeAction::Created:  return "CREATED";
    case ChangeAction::Modified: return "MODIFIED";
    case ChangeAction::Removed:  return "REMOVED";
  }
  return "UNKNOWN";
}

ChangeLog::ChangeLog(const std::filesystem::path& log_file, bool echo)
  : log_file_(log_file) {
  std::vector<spdlog::sink_ptr> sinks;
  // truncate = false: the log is only ever appended to
  sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file_.string(), false));
  if(echo) {
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
  }
  logger_ = std::make_shared<spdlog::logger>("treesync.changes", sinks.begin(), sinks.end());
  logger_->set_pattern(kChangePattern);
  logger_->set_level(spdlog::level::info);
  logger_->flush_on(spdlog::level::info);
}

ChangeLog::~ChangeLog() {
  if(logger_) logger_->flush();
}

void ChangeLog::emit(ChangeAction action, const std::filesystem::path& path) {
  logger_->info("[ {} ] {}", to_string(action), path.string());
}
