#include "support/Log.hpp"
#include "llvm/Support/WithColor.h"
#include <atomic>

namespace skscan {
namespace log {

static const char* const ToolName = "skillscan";
static std::atomic<bool> Verbose{false};

void setVerbose(bool on) { Verbose = on; }

llvm::raw_ostream& error() {
  return llvm::WithColor::error(llvm::errs(), ToolName);
}

llvm::raw_ostream& warning() {
  return llvm::WithColor::warning(llvm::errs(), ToolName);
}

llvm::raw_ostream& note() {
  if (!Verbose) return llvm::nulls();
  return llvm::WithColor::note(llvm::errs(), ToolName);
}

} // namespace log
} // namespace skscan
