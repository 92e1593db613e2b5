#pragma once
#include "llvm/ADT/STLFunctionalExtras.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include <string>
#include <vector>

namespace skscan {

struct EnumerateOptions {
  // Matched case-insensitively against the file extension (with the dot).
  std::vector<std::string> extensions = {".cs"};
  // Directory names that exclude every file beneath them, wherever they
  // appear in the path (the root's own segments included).
  std::vector<std::string> excludedDirs = {"bin", "obj", "packages",
                                           "node_modules", ".vs", ".git"};
};

// Walks a source tree lazily. Directories named in excludedDirs are never
// descended into, and a root that itself lies inside one yields nothing.
class FileEnumerator {
public:
  // Fails with ScanErrc::PathNotFound or ScanErrc::NotADirectory.
  static llvm::Expected<FileEnumerator> create(llvm::StringRef root,
                                               EnumerateOptions opts = {});

  // Calls fn once per matching regular file, in filesystem order.
  void forEachFile(llvm::function_ref<void(llvm::StringRef)> fn) const;

  std::vector<std::string> collect() const;

  bool isExcludedDir(llvm::StringRef name) const;
  bool hasSourceExtension(llvm::StringRef path) const;
  bool isUnderExcludedDir(llvm::StringRef path) const;

private:
  FileEnumerator(std::string root, EnumerateOptions opts)
    : Root(std::move(root)), Opts(std::move(opts)) {}

  std::string      Root;
  EnumerateOptions Opts;
};

} // namespace skscan
