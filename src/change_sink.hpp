#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

enum class ChangeAction {
  Created,
  Modified,
  Removed
};

const char* to_string(ChangeAction action);

// Receives one call per mutation applied to the replica.
class ChangeSink {
public:
  virtual ~ChangeSink() = default;
  virtual void emit(ChangeAction action, const std::filesystem::path& path) = 0;
};

struct ActionCounts {
  std::size_t created = 0;
  std::size_t modified = 0;
  std::size_t removed = 0;
  std::size_t unchanged = 0;
  std::size_t skipped = 0;   // entry vanished before it could be handled
  std::size_t failed = 0;    // per-entry I/O error, retried next cycle

  std::size_t changes() const { return created + modified + removed; }

  ActionCounts& operator+=(const ActionCounts& other) {
    created += other.created;
    modified += other.modified;
    removed += other.removed;
    unchanged += other.unchanged;
    skipped += other.skipped;
    failed += other.failed;
    return *this;
  }
};

struct CycleReport {
  ActionCounts counts;
  bool aborted = false;
  std::string abort_reason;
};
