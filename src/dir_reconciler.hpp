#pragma once

#include <filesystem>

#include "change_sink.hpp"
#include "tree_lister.hpp"

class Logger;

class DirReconciler {
public:
  DirReconciler(ChangeSink& sink, Logger& logger);

  // Creates directories missing from the replica (single level, relying on
  // the pre-order of source_dirs) and removes, recursively, replica
  // directories that no longer exist in the source.
  ActionCounts reconcile(const std::filesystem::path& source_root,
                         const std::filesystem::path& replica_root,
                         const DirectorySet& source_dirs,
                         const DirectorySet& replica_dirs);

private:
  void create_missing(const std::filesystem::path& source_root,
                      const std::filesystem::path& replica_root,
                      const RelativePath& relative,
                      ActionCounts& counts);
  void remove_stale(const std::filesystem::path& source_root,
                    const std::filesystem::path& replica_root,
                    const RelativePath& relative,
                    ActionCounts& counts);

  ChangeSink& sink_;
  Logger& logger_;
};
