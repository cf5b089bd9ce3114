#include "tree_lister.hpp"

#include <system_error>

#include "errors.hpp"
#include "log.hpp"

namespace fs = std::filesystem;

TreeLister::TreeLister(Logger* logger) : logger_(logger) {}

DirectorySet TreeLister::list_dirs(const fs::path& root) const {
  return walk(root, Collect::Directories);
}

FileSet TreeLister::list_files(const fs::path& root) const {
  return walk(root, Collect::Files);
}

std::vector<RelativePath> TreeLister::walk(const fs::path& root, Collect collect) const {
  std::error_code ec;
  if(!fs::is_directory(root, ec)) {
    throw NotFoundError(root);
  }

  std::vector<RelativePath> out;
  // Explicit worklist instead of recursion. A directory is recorded when its
  // parent is read, so it always precedes anything found beneath it.
  std::vector<fs::path> pending{root};
  while(!pending.empty()) {
    fs::path current = std::move(pending.back());
    pending.pop_back();

    fs::directory_iterator it(current, ec);
    if(ec) {
      if(current == root) throw NotFoundError(root);
      if(logger_) logger_->debug("Skipping {}: {}", current.string(), ec.message());
      ec.clear();
      continue;
    }

    for(; it != fs::directory_iterator(); it.increment(ec)) {
      std::error_code status_ec;
      auto status = it->symlink_status(status_ec);
      if(status_ec || fs::is_symlink(status)) continue;

      if(fs::is_directory(status)) {
        if(collect == Collect::Directories) {
          out.push_back(it->path().lexically_relative(root));
        }
        pending.push_back(it->path());
      } else if(collect == Collect::Files && fs::is_regular_file(status)) {
        out.push_back(it->path().lexically_relative(root));
      }
    }
    if(ec) {
      if(logger_) logger_->warn("Listing of {} cut short: {}", current.string(), ec.message());
      ec.clear();
    }
  }
  return out;
}
