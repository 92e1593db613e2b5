#pragma once
#include "llvm/Support/raw_ostream.h"

namespace skscan {
namespace log {

// Diagnostics go to stderr with "skillscan: error:" style prefixes.
// note() is swallowed unless verbose output was requested.
void setVerbose(bool on);

llvm::raw_ostream& error();
llvm::raw_ostream& warning();
llvm::raw_ostream& note();

} // namespace log
} // namespace skscan
