#include "discovery/FileEnumerator.hpp"
#include "support/Log.hpp"
#include "support/ScanError.hpp"

#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"
#include <algorithm>

namespace fs = llvm::sys::fs;
namespace path = llvm::sys::path;

namespace skscan {

llvm::Expected<FileEnumerator> FileEnumerator::create(llvm::StringRef root,
                                                      EnumerateOptions opts) {
  if (root.empty() || !fs::exists(root))
    return makeScanError(ScanErrc::PathNotFound, "path not found: '" + root + "'");
  if (!fs::is_directory(root))
    return makeScanError(ScanErrc::NotADirectory, "not a directory: '" + root + "'");
  return FileEnumerator(root.str(), std::move(opts));
}

bool FileEnumerator::isExcludedDir(llvm::StringRef name) const {
  return std::any_of(Opts.excludedDirs.begin(), Opts.excludedDirs.end(),
                     [name](const std::string& d) { return name.equals_insensitive(d); });
}

bool FileEnumerator::hasSourceExtension(llvm::StringRef p) const {
  llvm::StringRef ext = path::extension(p);
  if (ext.empty()) return false;
  return std::any_of(Opts.extensions.begin(), Opts.extensions.end(),
                     [ext](const std::string& e) { return ext.equals_insensitive(e); });
}

bool FileEnumerator::isUnderExcludedDir(llvm::StringRef p) const {
  for (auto it = path::begin(p), end = path::end(p); it != end; ++it)
    if (isExcludedDir(*it)) return true;
  return false;
}

void FileEnumerator::forEachFile(llvm::function_ref<void(llvm::StringRef)> fn) const {
  if (isUnderExcludedDir(Root)) {
    log::note() << "skipping " << Root << ": inside an excluded directory\n";
    return;
  }

  // Explicit stack instead of recursive_directory_iterator: an unreadable
  // subdirectory is reported and skipped without ending the walk.
  std::vector<std::string> pending{Root};

  while (!pending.empty()) {
    std::string dir = std::move(pending.back());
    pending.pop_back();

    std::vector<std::string> subdirs;
    std::error_code EC;
    fs::directory_iterator It(dir, EC, /*follow_symlinks=*/false), End;
    for (; It != End && !EC; It.increment(EC)) {
      const std::string& entry = It->path();
      fs::file_type type = It->type();

      // Symlinks are resolved for files only; linked directories are not
      // followed, so link cycles cannot occur.
      if (type == fs::file_type::type_unknown) {
        fs::file_status st;
        if (fs::status(entry, st, /*follow=*/false)) continue;
        type = st.type();
      }
      if (type == fs::file_type::symlink_file) {
        fs::file_status st;
        if (fs::status(entry, st, /*follow=*/true)) continue;
        if (st.type() != fs::file_type::regular_file) continue;
        type = fs::file_type::regular_file;
      }

      if (type == fs::file_type::directory_file) {
        if (isExcludedDir(path::filename(entry))) {
          log::note() << "skipping " << entry << "\n";
          continue;
        }
        subdirs.push_back(entry);
        continue;
      }
      if (type == fs::file_type::regular_file && hasSourceExtension(entry))
        fn(entry);
    }
    if (EC)
      log::warning() << "cannot read directory '" << dir << "': " << EC.message() << "\n";

    // Reverse so subdirectories are visited in the order they were listed
    pending.insert(pending.end(), subdirs.rbegin(), subdirs.rend());
  }
}

std::vector<std::string> FileEnumerator::collect() const {
  std::vector<std::string> files;
  forEachFile([&](llvm::StringRef p) { files.push_back(p.str()); });
  return files;
}

} // namespace skscan
