#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <thread>

#include "change_sink.hpp"
#include "log.hpp"

// Runs a SyncCycle, waits for the interval, runs the next one. Cycles never
// overlap: a slow cycle only delays the next start.
class SyncService {
public:
  struct Options {
    std::filesystem::path source_root;
    std::filesystem::path replica_root;
    std::chrono::seconds interval{60};
    std::size_t max_cycles = 0;       // 0 = until stopped
    bool handle_signals = true;       // stop on SIGINT / SIGTERM
  };

  struct Stats {
    std::size_t cycles = 0;
    std::size_t aborted_cycles = 0;
    ActionCounts totals;
  };

  SyncService(Options options,
              std::shared_ptr<ChangeSink> sink,
              std::shared_ptr<Logger> logger = nullptr);
  ~SyncService();

  SyncService(const SyncService&) = delete;
  SyncService& operator=(const SyncService&) = delete;

  void start();
  void run();
  void start_background();
  void stop();

  Stats stats() const;
  std::shared_ptr<Logger> logger() const { return logger_; }
  const Options& options() const { return options_; }

private:
  void run_cycle();
  void schedule_next();
  void finish();

  Options options_;
  std::shared_ptr<ChangeSink> sink_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  std::thread io_thread_;
  std::unique_ptr<asio::steady_timer> timer_;
  std::unique_ptr<asio::signal_set> signals_;
  std::atomic<bool> started_{false};
  mutable std::mutex stats_mutex_;
  Stats stats_;
};
