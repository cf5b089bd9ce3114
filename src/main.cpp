#include <cpptrace/cpptrace.hpp>

#include <chrono>
#include <memory>

#include "change_log.hpp"
#include "command_line_parser.hpp"
#include "errors.hpp"
#include "launch_config.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "sync_service.hpp"

int main(int argc, char** argv){
  CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "treesync");
  try {
    SettingsManager settings;
    parser.parse(argc, argv, settings);
    if(settings.help_requested()) {
      parser.usage();
      return 0;
    }

    auto launch = resolve_launch_config(settings);
    init(launch.verbose);

    auto logger = std::make_shared<Logger>("treesync");
    logger->debug("Verbose logging enabled");

    auto change_log = std::make_shared<ChangeLog>(launch.log_file);

    SyncService::Options options;
    options.source_root = launch.source;
    options.replica_root = launch.replica;
    options.interval = launch.interval;
    options.max_cycles = launch.once ? 1 : 0;

    SyncService service(options, change_log, logger);
    service.run();
    logger->info("Stopped after {} cycles", service.stats().cycles);
    return 0;
  } catch(const ConfigError& e) {
    init(false);
    print_err(nullptr, "Error: {}", e.what());
    parser.usage();
    return 1;
  } catch(std::exception& e) {
    init(false);
    Logger logger("treesync-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
