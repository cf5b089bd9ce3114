#pragma once

#include <filesystem>

#include "change_sink.hpp"
#include "path_hasher.hpp"
#include "tree_lister.hpp"

class Logger;

class FileReconciler {
public:
  FileReconciler(ChangeSink& sink, Logger& logger);

  // Copies files missing from the replica, replaces those whose digest
  // differs from the source and removes those absent from the source.
  // Existence is checked again right before each change. Per-file I/O
  // errors are logged and counted as failed; the pass carries on.
  ActionCounts reconcile(const std::filesystem::path& source_root,
                         const std::filesystem::path& replica_root,
                         const FileSet& source_files,
                         const FileSet& replica_files);

private:
  void mirror(const std::filesystem::path& origin,
              const std::filesystem::path& target,
              ActionCounts& counts);
  void prune(const std::filesystem::path& origin,
             const std::filesystem::path& target,
             ActionCounts& counts);

  // Copies origin beside target (mtime included), then renames it over
  // target, so a failed copy leaves the replica entry as it was. False when
  // the source vanished before or during the copy.
  bool install_copy(const std::filesystem::path& origin,
                    const std::filesystem::path& target);
  static std::filesystem::path staging_path(const std::filesystem::path& target);

  ChangeSink& sink_;
  Logger& logger_;
  PathHasher hasher_;
};
