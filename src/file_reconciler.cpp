#include "file_reconciler.hpp"

#include <system_error>

#include "errors.hpp"
#include "log.hpp"

namespace fs = std::filesystem;

namespace {

bool is_regular(const fs::path& path) {
  std::error_code ec;
  return fs::is_regular_file(fs::symlink_status(path, ec));
}

} // namespace

FileReconciler::FileReconciler(ChangeSink& sink, Logger& logger)
  : sink_(sink), logger_(logger) {}

ActionCounts FileReconciler::reconcile(const fs::path& source_root,
                                       const fs::path& replica_root,
                                       const FileSet& source_files,
                                       const FileSet& replica_files) {
  ActionCounts counts;
  auto guarded = [&](const RelativePath& relative, auto&& step) {
    try {
      step(source_root / relative, replica_root / relative);
    } catch(const IOError& e) {
      logger_.error("{}", e.what());
      ++counts.failed;
    } catch(const fs::filesystem_error& e) {
      logger_.error("{}", e.what());
      ++counts.failed;
    }
  };

  for(const auto& relative : source_files) {
    guarded(relative, [&](const fs::path& origin, const fs::path& target) {
      mirror(origin, target, counts);
    });
  }
  for(const auto& relative : replica_files) {
    guarded(relative, [&](const fs::path& origin, const fs::path& target) {
      prune(origin, target, counts);
    });
  }
  return counts;
}

void FileReconciler::mirror(const fs::path& origin,
                            const fs::path& target,
                            ActionCounts& counts) {
  if(!is_regular(origin)) {
    logger_.debug("Source file {} vanished before it was mirrored", origin.string());
    ++counts.skipped;
    return;
  }

  std::error_code ec;
  const auto target_status = fs::symlink_status(target, ec);
  const bool existed = fs::exists(target_status);

  if(fs::is_regular_file(target_status)) {
    bool same = false;
    try {
      same = hasher_.equal_content(origin, target);
    } catch(const IOError&) {
      if(is_regular(origin)) throw;
      logger_.debug("Source file {} vanished while hashing", origin.string());
      ++counts.skipped;
      return;
    }
    if(same) {
      ++counts.unchanged;
      return;
    }
  }

  // The replica lacks the file or holds something different under its name.
  if(!install_copy(origin, target)) {
    ++counts.skipped;
    return;
  }
  if(existed) {
    sink_.emit(ChangeAction::Modified, target);
    ++counts.modified;
  } else {
    sink_.emit(ChangeAction::Created, target);
    ++counts.created;
  }
}

void FileReconciler::prune(const fs::path& origin,
                           const fs::path& target,
                           ActionCounts& counts) {
  if(!is_regular(target)) return;
  if(is_regular(origin)) return;

  fs::remove(target);
  sink_.emit(ChangeAction::Removed, target);
  ++counts.removed;
}

fs::path FileReconciler::staging_path(const fs::path& target) {
  return target.parent_path() / (".treesync." + target.filename().string() + ".part");
}

bool FileReconciler::install_copy(const fs::path& origin, const fs::path& target) {
  const auto staging = staging_path(target);
  auto discard_staging = [&staging]() {
    std::error_code cleanup;
    if(fs::is_regular_file(fs::symlink_status(staging, cleanup))) fs::remove(staging, cleanup);
  };

  std::error_code ec;
  fs::copy_file(origin, staging, fs::copy_options::overwrite_existing, ec);
  if(ec) {
    discard_staging();
    if(!is_regular(origin)) {
      logger_.debug("Source file {} vanished during copy", origin.string());
      return false;
    }
    throw IOError(target, "copy failed (" + ec.message() + ")");
  }

  auto stamp = fs::last_write_time(origin, ec);
  if(!ec) fs::last_write_time(staging, stamp, ec);
  if(ec) {
    logger_.warn("Copied {} but kept the current modification time: {}", target.string(), ec.message());
    ec.clear();
  }

  // rename() swaps a regular file in one step; anything else has to go first.
  bool cleared = false;
  const auto target_status = fs::symlink_status(target, ec);
  if(fs::exists(target_status) && !fs::is_regular_file(target_status)) {
    fs::remove_all(target, ec);
    if(ec) {
      discard_staging();
      throw IOError(target, "unable to clear the way for a file (" + ec.message() + ")");
    }
    cleared = true;
  }

  fs::rename(staging, target, ec);
  if(ec) {
    discard_staging();
    if(cleared) sink_.emit(ChangeAction::Removed, target);
    throw IOError(target, "unable to move the copy into place (" + ec.message() + ")");
  }
  return true;
}
