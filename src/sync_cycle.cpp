#include "sync_cycle.hpp"

#include <utility>

#include "dir_reconciler.hpp"
#include "errors.hpp"
#include "file_reconciler.hpp"
#include "log.hpp"

SyncCycle::SyncCycle(std::filesystem::path source_root,
                     std::filesystem::path replica_root,
                     ChangeSink& sink,
                     Logger& logger)
  : source_root_(std::move(source_root)),
    replica_root_(std::move(replica_root)),
    sink_(sink),
    logger_(logger),
    lister_(&logger) {}

CycleReport SyncCycle::run() {
  CycleReport report;
  try {
    report.counts += sync_directories();
    report.counts += sync_files();
  } catch(const NotFoundError& e) {
    report.aborted = true;
    report.abort_reason = e.what();
    logger_.error("Sync cycle aborted: {}", e.what());
  }
  return report;
}

ActionCounts SyncCycle::sync_directories() {
  const auto source_dirs = lister_.list_dirs(source_root_);
  const auto replica_dirs = lister_.list_dirs(replica_root_);
  logger_.debug("Directories: {} in source, {} in replica", source_dirs.size(), replica_dirs.size());
  DirReconciler reconciler(sink_, logger_);
  return reconciler.reconcile(source_root_, replica_root_, source_dirs, replica_dirs);
}

ActionCounts SyncCycle::sync_files() {
  const auto source_files = lister_.list_files(source_root_);
  const auto replica_files = lister_.list_files(replica_root_);
  logger_.debug("Files: {} in source, {} in replica", source_files.size(), replica_files.size());
  FileReconciler reconciler(sink_, logger_);
  return reconciler.reconcile(source_root_, replica_root_, source_files, replica_files);
}
