#pragma once

#include <filesystem>

#include "change_sink.hpp"
#include "tree_lister.hpp"

class Logger;

// One directory-then-file pass over both trees. Listings are taken fresh on
// every run() and dropped when it returns.
class SyncCycle {
public:
  SyncCycle(std::filesystem::path source_root,
            std::filesystem::path replica_root,
            ChangeSink& sink,
            Logger& logger);

  // A root that cannot be listed aborts the pass (report.aborted) instead
  // of throwing.
  CycleReport run();

private:
  ActionCounts sync_directories();
  ActionCounts sync_files();

  std::filesystem::path source_root_;
  std::filesystem::path replica_root_;
  ChangeSink& sink_;
  Logger& logger_;
  TreeLister lister_;
};
