#include "sync_service.hpp"

#include <csignal>
#include <stdexcept>
#include <utility>

#include "sync_cycle.hpp"
#include "utils.hpp"

SyncService::SyncService(Options options,
                         std::shared_ptr<ChangeSink> sink,
                         std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    sink_(std::move(sink)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("sync-service")) {
  if(!sink_) {
    throw std::runtime_error("SyncService needs a change sink");
  }
  const auto longest = std::chrono::duration_cast<std::chrono::seconds>(
    asio::steady_timer::duration::max());
  if(options_.interval.count() < 0) {
    options_.interval = std::chrono::seconds(0);
  } else if(options_.interval > longest) {
    options_.interval = longest;
  }
  options_.source_root = normalize_root(options_.source_root);
  options_.replica_root = normalize_root(options_.replica_root);
}

SyncService::~SyncService() {
  stop();
}

void SyncService::start() {
  if(started_.exchange(true)) return;

  timer_ = std::make_unique<asio::steady_timer>(io_);
  if(options_.handle_signals) {
    signals_ = std::make_unique<asio::signal_set>(io_, SIGINT, SIGTERM);
    signals_->async_wait([this](const std::error_code& ec, int signal_number){
      if(ec) return;
      logger_->info("Signal {} received, stopping", signal_number);
      finish();
    });
  }

  logger_->info("Mirroring {} into {} every {}s",
                options_.source_root.string(),
                options_.replica_root.string(),
                options_.interval.count());
  asio::post(io_, [this](){ run_cycle(); });
}

void SyncService::run_cycle() {
  if(!started_) return;

  SyncCycle cycle(options_.source_root, options_.replica_root, *sink_, *logger_);
  auto report = cycle.run();

  std::size_t done = 0;
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.cycles;
    if(report.aborted) ++stats_.aborted_cycles;
    stats_.totals += report.counts;
    done = stats_.cycles;
  }

  const auto& counts = report.counts;
  if(counts.changes() > 0 || counts.failed > 0) {
    logger_->info("Cycle {}: {} created, {} modified, {} removed, {} failed",
                  done, counts.created, counts.modified, counts.removed, counts.failed);
  } else if(!report.aborted) {
    logger_->debug("Cycle {}: replica up to date ({} files unchanged)", done, counts.unchanged);
  }

  if(options_.max_cycles != 0 && done >= options_.max_cycles) {
    finish();
    return;
  }
  schedule_next();
}

void SyncService::schedule_next() {
  if(!timer_ || !started_) return;
  timer_->expires_after(options_.interval);
  timer_->async_wait([this](const std::error_code& ec){
    if(ec || !started_) return;
    run_cycle();
  });
}

void SyncService::finish() {
  started_ = false;
  if(timer_) timer_->cancel();
  if(signals_) signals_->cancel();
}

void SyncService::run() {
  if(!started_) start();
  io_.run();
}

void SyncService::start_background() {
  if(!started_) start();
  if(io_thread_.joinable()) return;
  io_thread_ = std::thread([this](){
    io_.run();
  });
}

void SyncService::stop() {
  started_ = false;
  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  io_.restart();
}

SyncService::Stats SyncService::stats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}
