#include "dir_reconciler.hpp"

#include <system_error>

#include "log.hpp"

namespace fs = std::filesystem;

DirReconciler::DirReconciler(ChangeSink& sink, Logger& logger)
  : sink_(sink), logger_(logger) {}

ActionCounts DirReconciler::reconcile(const fs::path& source_root,
                                      const fs::path& replica_root,
                                      const DirectorySet& source_dirs,
                                      const DirectorySet& replica_dirs) {
  ActionCounts counts;
  for(const auto& relative : source_dirs) {
    create_missing(source_root, replica_root, relative, counts);
  }
  for(const auto& relative : replica_dirs) {
    remove_stale(source_root, replica_root, relative, counts);
  }
  return counts;
}

void DirReconciler::create_missing(const fs::path& source_root,
                                   const fs::path& replica_root,
                                   const RelativePath& relative,
                                   ActionCounts& counts) {
  const auto origin = source_root / relative;
  const auto target = replica_root / relative;

  std::error_code ec;
  const auto target_status = fs::symlink_status(target, ec);
  if(fs::is_directory(target_status)) return;

  if(!fs::is_directory(fs::symlink_status(origin, ec))) {
    logger_.debug("Source directory {} vanished before it was mirrored", origin.string());
    ++counts.skipped;
    return;
  }

  if(fs::exists(target_status)) {
    // a file or link holds the name the directory needs
    fs::remove(target, ec);
    if(ec) {
      logger_.error("Unable to remove {} to make room for a directory: {}", target.string(), ec.message());
      ++counts.failed;
      return;
    }
    sink_.emit(ChangeAction::Removed, target);
    ++counts.removed;
  }

  fs::create_directory(target, ec);
  if(ec) {
    logger_.error("Unable to create directory {}: {}", target.string(), ec.message());
    ++counts.failed;
    return;
  }
  sink_.emit(ChangeAction::Created, target);
  ++counts.created;
}

void DirReconciler::remove_stale(const fs::path& source_root,
                                 const fs::path& replica_root,
                                 const RelativePath& relative,
                                 ActionCounts& counts) {
  const auto origin = source_root / relative;
  const auto target = replica_root / relative;

  std::error_code ec;
  // Gone already when an ancestor was removed earlier in this pass.
  if(!fs::is_directory(fs::symlink_status(target, ec))) return;
  if(fs::is_directory(fs::symlink_status(origin, ec))) return;

  fs::remove_all(target, ec);
  if(ec) {
    logger_.error("Unable to remove directory {}: {}", target.string(), ec.message());
    ++counts.failed;
    return;
  }
  sink_.emit(ChangeAction::Removed, target);
  ++counts.removed;
}
