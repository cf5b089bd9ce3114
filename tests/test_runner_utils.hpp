#pragma once

#include "change_sink.hpp"
#include "log.hpp"
#include "utils.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace treesync::test {

class LogCapture {
public:
  LogCapture() = default;

  ~LogCapture() {
    detach_all();
  }

  void attach(const std::shared_ptr<Logger>& logger,
              const std::string& label = std::string()) {
    if(!logger) return;
    auto handle = logger->add_listener(
      [this, label](void*,
                    const std::string& channel,
                    spdlog::level::level_enum,
                    const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if(!label.empty()) {
          lines_.emplace_back(label + ": " + message);
        } else {
          lines_.emplace_back(channel + ": " + message);
        }
        return false;
      },
      nullptr);
    std::lock_guard<std::mutex> lock(attachments_mutex_);
    attachments_.push_back({logger, handle});
  }

  void detach_all() {
    std::vector<Attachment> pending;
    {
      std::lock_guard<std::mutex> lock(attachments_mutex_);
      pending.swap(attachments_);
    }
    for(auto& attachment : pending) {
      if(attachment.logger && attachment.handle != 0) {
        attachment.logger->remove_listener(attachment.handle);
      }
    }
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  bool contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(lines_.begin(), lines_.end(),
      [&](const std::string& line){ return line.find(needle) != std::string::npos; });
  }

private:
  struct Attachment {
    std::shared_ptr<Logger> logger;
    LogListenerHandle handle = 0;
  };

  mutable std::mutex mutex_;
  std::vector<std::string> lines_;
  std::mutex attachments_mutex_;
  std::vector<Attachment> attachments_;
};

struct TestContext {
  LogCapture& logs;
  std::shared_ptr<Logger> logger;
  bool verbose = false;
  std::vector<std::string> failures;
};

// Records the failing check's line and returns false for the test to return.
inline bool fail(TestContext& ctx, int line) {
  ctx.failures.push_back("check failed at line " + std::to_string(line));
  return false;
}

// ChangeSink that keeps every entry in memory.
class RecordingSink : public ChangeSink {
public:
  struct Entry {
    ChangeAction action;
    std::filesystem::path path;
  };

  void emit(ChangeAction action, const std::filesystem::path& path) override {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back({action, path});
  }

  std::vector<Entry> entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
  }

  std::size_t count(ChangeAction action) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(),
      [&](const Entry& e){ return e.action == action; }));
  }

  bool has(ChangeAction action, const std::filesystem::path& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(entries_.begin(), entries_.end(),
      [&](const Entry& e){ return e.action == action && e.path == path; });
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
  }

private:
  mutable std::mutex mutex_;
  std::vector<Entry> entries_;
};

// source/ and replica/ directories under a fresh temporary root, removed on
// destruction.
class TempWorkspace {
public:
  explicit TempWorkspace(const std::string& name)
    : root_(std::filesystem::temp_directory_path() / "treesync_tests" / name) {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
    std::filesystem::create_directories(source(), ec);
    std::filesystem::create_directories(replica(), ec);
  }

  ~TempWorkspace() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  TempWorkspace(const TempWorkspace&) = delete;
  TempWorkspace& operator=(const TempWorkspace&) = delete;

  const std::filesystem::path& root() const { return root_; }
  std::filesystem::path source() const { return root_ / "source"; }
  std::filesystem::path replica() const { return root_ / "replica"; }

private:
  std::filesystem::path root_;
};

inline void write_file(const std::filesystem::path& path, const std::string& content) {
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

inline std::string read_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

inline std::vector<std::string> read_lines(const std::filesystem::path& path) {
  std::ifstream in(path);
  std::vector<std::string> lines;
  std::string line;
  while(std::getline(in, line)) lines.push_back(line);
  return lines;
}

// Every entry under root as "d:<relative>" / "f:<relative>:<content>".
// Two trees with equal snapshots hold the same structure and bytes.
inline std::set<std::string> snapshot_tree(const std::filesystem::path& root) {
  std::set<std::string> out;
  for(const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
    auto relative = relative_key(entry.path().lexically_relative(root));
    if(entry.is_symlink()) {
      out.insert("l:" + relative);
    } else if(entry.is_directory()) {
      out.insert("d:" + relative);
    } else if(entry.is_regular_file()) {
      out.insert("f:" + relative + ":" + read_file(entry.path()));
    }
  }
  return out;
}

inline bool wait_for_condition(std::function<bool()> predicate,
                               std::chrono::milliseconds timeout,
                               std::chrono::milliseconds interval = std::chrono::milliseconds(20)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while(std::chrono::steady_clock::now() < deadline) {
    if(predicate()) return true;
    std::this_thread::sleep_for(interval);
  }
  return predicate();
}

} // namespace treesync::test
