#include "test_cases.hpp"

#include "change_log.hpp"
#include "command_line_parser.hpp"
#include "errors.hpp"
#include "launch_config.hpp"
#include "settings_manager.hpp"
#include "sync_service.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace treesync::test {

namespace {

// Owns argv storage for CommandLineParser::parse.
class Argv {
public:
  Argv(std::initializer_list<std::string> args) : storage_(args) {
    storage_.insert(storage_.begin(), "treesync");
    for(auto& arg : storage_) pointers_.push_back(arg.data());
    pointers_.push_back(nullptr);
  }

  Argv(const Argv&) = delete;
  Argv& operator=(const Argv&) = delete;

  int argc() const { return static_cast<int>(storage_.size()); }
  char** argv() { return pointers_.data(); }

private:
  std::vector<std::string> storage_;
  std::vector<char*> pointers_;
};

bool parse_fails(Argv args) {
  CommandLineParser parser;
  SettingsManager settings;
  try {
    parser.parse(args.argc(), args.argv(), settings);
  } catch(const ConfigError&) {
    return true;
  }
  return false;
}

std::shared_ptr<Logger> attached_logger(TestContext& ctx, const std::string& name) {
  auto logger = std::make_shared<Logger>(name);
  ctx.logs.attach(logger, name);
  return logger;
}

} // namespace

bool test_change_log_line_format(TestContext& ctx) {
  TempWorkspace ws("change_log_format");
  auto log_path = ws.root() / "changes.log";
  auto created_path = ws.replica() / "docs";
  auto removed_path = ws.replica() / "old.txt";
  {
    ChangeLog change_log(log_path, false);
    change_log.emit(ChangeAction::Created, created_path);
    change_log.emit(ChangeAction::Removed, removed_path);
  }

  auto lines = read_lines(log_path);
  if(lines.size() != 2) return fail(ctx, __LINE__);

  const std::regex created_line(
    R"(^\d{2}/(Jan|Feb|Mar|Apr|May|Jun|Jul|Aug|Sep|Oct|Nov|Dec)/\d{4} \d{2}:\d{2}:\d{2} \[ CREATED \] (.+)$)");
  const std::regex removed_line(
    R"(^\d{2}/[A-Z][a-z]{2}/\d{4} \d{2}:\d{2}:\d{2} \[ REMOVED \] (.+)$)");
  std::smatch match;
  if(!std::regex_match(lines[0], match, created_line)) return fail(ctx, __LINE__);
  if(match[2].str() != created_path.string()) return fail(ctx, __LINE__);
  if(!std::regex_match(lines[1], match, removed_line)) return fail(ctx, __LINE__);
  if(match[1].str() != removed_path.string()) return fail(ctx, __LINE__);
  return true;
}

bool test_change_log_appends(TestContext& ctx) {
  TempWorkspace ws("change_log_append");
  auto log_path = ws.root() / "changes.log";
  write_file(log_path, "earlier entry\n");
  {
    ChangeLog change_log(log_path, false);
    change_log.emit(ChangeAction::Modified, ws.replica() / "a.txt");
  }
  auto lines = read_lines(log_path);
  if(lines.size() != 2) return fail(ctx, __LINE__);
  if(lines[0] != "earlier entry") return fail(ctx, __LINE__);
  if(lines[1].find("[ MODIFIED ] ") == std::string::npos) return fail(ctx, __LINE__);
  return true;
}

bool test_parser_reads_positionals(TestContext& ctx) {
  CommandLineParser parser;
  SettingsManager settings;
  Argv args{"/data/src", "/data/replica", "/var/log/sync.log", "30", "--verbose"};
  parser.parse(args.argc(), args.argv(), settings);
  if(settings.get<std::string>("source") != "/data/src") return fail(ctx, __LINE__);
  if(settings.get<std::string>("replica") != "/data/replica") return fail(ctx, __LINE__);
  if(settings.get<std::string>("log_file") != "/var/log/sync.log") return fail(ctx, __LINE__);
  if(settings.get<std::uint64_t>("interval") != 30) return fail(ctx, __LINE__);
  if(!settings.get<bool>("verbose")) return fail(ctx, __LINE__);
  if(settings.get<bool>("once")) return fail(ctx, __LINE__);
  return true;
}

bool test_parser_rejects_wrong_count(TestContext& ctx) {
  if(!parse_fails(Argv{})) return fail(ctx, __LINE__);
  if(!parse_fails(Argv{"src", "replica", "log"})) return fail(ctx, __LINE__);
  if(!parse_fails(Argv{"src", "replica", "log", "10", "extra"})) return fail(ctx, __LINE__);
  if(!parse_fails(Argv{"src", "replica", "log", "10", "--no-such-option"})) return fail(ctx, __LINE__);
  return true;
}

bool test_parser_rejects_bad_interval(TestContext& ctx) {
  if(!parse_fails(Argv{"src", "replica", "log", "abc"})) return fail(ctx, __LINE__);
  if(!parse_fails(Argv{"src", "replica", "log", "-1"})) return fail(ctx, __LINE__);
  if(!parse_fails(Argv{"src", "replica", "log", "1.5"})) return fail(ctx, __LINE__);
  if(!parse_fails(Argv{"src", "replica", "log", "10s"})) return fail(ctx, __LINE__);
  if(parse_fails(Argv{"src", "replica", "log", "0"})) return fail(ctx, __LINE__);
  return true;
}

bool test_parser_help_skips_count(TestContext& ctx) {
  CommandLineParser parser;
  SettingsManager settings;
  Argv args{"--help"};
  parser.parse(args.argc(), args.argv(), settings);
  if(!settings.help_requested()) return fail(ctx, __LINE__);
  return true;
}

bool test_parser_config_file_underneath_cli(TestContext& ctx) {
  TempWorkspace ws("parser_config");
  auto config_path = ws.root() / "treesync.json";
  {
    std::ofstream out(config_path);
    out << nlohmann::json{{"interval", 9}, {"verbose", true}, {"once", true}}.dump(2);
  }

  CommandLineParser parser;
  SettingsManager settings;
  Argv args{"src", "replica", "log", "3", "--config", config_path.string(), "--once", "false"};
  parser.parse(args.argc(), args.argv(), settings);
  if(settings.get<std::uint64_t>("interval") != 3) return fail(ctx, __LINE__);
  if(!settings.get<bool>("verbose")) return fail(ctx, __LINE__);
  if(settings.get<bool>("once")) return fail(ctx, __LINE__);

  SettingsManager missing;
  Argv bad{"src", "replica", "log", "3", "--config", (ws.root() / "absent.json").string()};
  bool threw = false;
  try {
    parser.parse(bad.argc(), bad.argv(), missing);
  } catch(const ConfigError&) {
    threw = true;
  }
  if(!threw) return fail(ctx, __LINE__);
  return true;
}

bool test_launch_config_validates_paths(TestContext& ctx) {
  TempWorkspace ws("launch_config");
  auto log_path = ws.root() / "sync.log";
  write_file(log_path, "");

  auto configure = [](SettingsManager& settings, const fs::path& source,
                      const fs::path& replica, const fs::path& log) {
    std::string error;
    settings.set_from_json("source", source.string(), error);
    settings.set_from_json("replica", replica.string(), error);
    settings.set_from_json("log_file", log.string(), error);
    settings.set_from_json("interval", 15, error);
  };

  SettingsManager good;
  configure(good, ws.source(), ws.replica(), log_path);
  auto launch = resolve_launch_config(good);
  if(launch.source != normalize_root(ws.source())) return fail(ctx, __LINE__);
  if(launch.replica != normalize_root(ws.replica())) return fail(ctx, __LINE__);
  if(launch.interval != std::chrono::seconds(15)) return fail(ctx, __LINE__);

  SettingsManager missing_replica;
  configure(missing_replica, ws.source(), ws.root() / "nowhere", log_path);
  bool threw = false;
  try {
    resolve_launch_config(missing_replica);
  } catch(const ConfigError& e) {
    threw = std::string(e.what()).find("nowhere") != std::string::npos;
  }
  if(!threw) return fail(ctx, __LINE__);

  SettingsManager missing_log;
  configure(missing_log, ws.source(), ws.replica(), ws.root() / "no.log");
  threw = false;
  try {
    resolve_launch_config(missing_log);
  } catch(const ConfigError&) {
    threw = true;
  }
  if(!threw) return fail(ctx, __LINE__);

  fs::create_directories(ws.source() / "inner");
  SettingsManager nested;
  configure(nested, ws.source(), ws.source() / "inner", log_path);
  threw = false;
  try {
    resolve_launch_config(nested);
  } catch(const ConfigError&) {
    threw = true;
  }
  if(!threw) return fail(ctx, __LINE__);
  return true;
}

bool test_launch_config_rejects_huge_interval(TestContext& ctx) {
  TempWorkspace ws("launch_interval");
  auto log_path = ws.root() / "sync.log";
  write_file(log_path, "");

  auto resolve = [&](const std::string& interval) {
    CommandLineParser parser;
    SettingsManager settings;
    Argv args{ws.source().string(), ws.replica().string(), log_path.string(), interval};
    parser.parse(args.argc(), args.argv(), settings);
    return resolve_launch_config(settings);
  };
  auto rejected = [&](const std::string& interval) {
    try {
      resolve(interval);
    } catch(const ConfigError& e) {
      return std::string(e.what()).find("out of range") != std::string::npos;
    }
    return false;
  };

  if(!rejected("18446744073709551615")) return fail(ctx, __LINE__);
  if(!rejected("100000000000")) return fail(ctx, __LINE__);
  if(!rejected("9223372037")) return fail(ctx, __LINE__);

  // the largest wait steady_clock can still express
  if(resolve("9223372036").interval != std::chrono::seconds(9223372036LL)) return fail(ctx, __LINE__);
  return true;
}

bool test_service_runs_max_cycles(TestContext& ctx) {
  TempWorkspace ws("service_cycles");
  write_file(ws.source() / "data" / "file.txt", "payload");

  auto sink = std::make_shared<RecordingSink>();
  SyncService::Options options;
  options.source_root = ws.source();
  options.replica_root = ws.replica();
  options.interval = std::chrono::seconds(0);
  options.max_cycles = 3;
  options.handle_signals = false;

  SyncService service(options, sink, attached_logger(ctx, "service"));
  service.run();

  auto stats = service.stats();
  if(stats.cycles != 3) return fail(ctx, __LINE__);
  if(stats.aborted_cycles != 0) return fail(ctx, __LINE__);
  if(stats.totals.created != 2) return fail(ctx, __LINE__);
  if(stats.totals.unchanged != 2) return fail(ctx, __LINE__);
  if(sink->size() != 2) return fail(ctx, __LINE__);
  if(read_file(ws.replica() / "data" / "file.txt") != "payload") return fail(ctx, __LINE__);
  return true;
}

bool test_service_stop_interrupts_wait(TestContext& ctx) {
  using namespace std::chrono_literals;
  TempWorkspace ws("service_stop");
  write_file(ws.source() / "a.txt", "a");

  auto sink = std::make_shared<RecordingSink>();
  SyncService::Options options;
  options.source_root = ws.source();
  options.replica_root = ws.replica();
  options.interval = std::chrono::hours(1);
  options.handle_signals = false;

  SyncService service(options, sink, attached_logger(ctx, "service"));
  service.start_background();
  bool ran = wait_for_condition([&]{ return service.stats().cycles >= 1; }, 5s);
  auto stop_started = std::chrono::steady_clock::now();
  service.stop();
  auto stop_took = std::chrono::steady_clock::now() - stop_started;

  if(!ran) return fail(ctx, __LINE__);
  if(service.stats().cycles != 1) return fail(ctx, __LINE__);
  if(stop_took >= 5s) return fail(ctx, __LINE__);
  if(!sink->has(ChangeAction::Created, normalize_root(ws.replica()) / "a.txt")) return fail(ctx, __LINE__);
  return true;
}

bool test_service_survives_missing_source(TestContext& ctx) {
  TempWorkspace ws("service_missing_source");
  auto sink = std::make_shared<RecordingSink>();
  SyncService::Options options;
  options.source_root = ws.source();
  options.replica_root = ws.replica();
  options.interval = std::chrono::seconds(0);
  options.max_cycles = 2;
  options.handle_signals = false;

  SyncService service(options, sink, attached_logger(ctx, "service"));
  fs::remove_all(ws.source());
  service.run();

  auto stats = service.stats();
  if(stats.cycles != 2) return fail(ctx, __LINE__);
  if(stats.aborted_cycles != 2) return fail(ctx, __LINE__);
  if(sink->size() != 0) return fail(ctx, __LINE__);
  if(!ctx.logs.contains("aborted")) return fail(ctx, __LINE__);
  return true;
}

} // namespace treesync::test
