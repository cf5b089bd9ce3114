#pragma once

#include <filesystem>
#include <vector>

class Logger;

using RelativePath = std::filesystem::path;
// Pre-order: every directory appears before its descendants.
using DirectorySet = std::vector<RelativePath>;
using FileSet = std::vector<RelativePath>;

// Enumerates a tree without following or reporting symbolic links. Paths are
// relative to the root passed in, whatever the depth.
class TreeLister {
public:
  explicit TreeLister(Logger* logger = nullptr);

  // Both throw NotFoundError when root is missing or not a directory.
  DirectorySet list_dirs(const std::filesystem::path& root) const;
  FileSet list_files(const std::filesystem::path& root) const;

private:
  enum class Collect { Directories, Files };

  std::vector<RelativePath> walk(const std::filesystem::path& root, Collect collect) const;

  Logger* logger_;
};
