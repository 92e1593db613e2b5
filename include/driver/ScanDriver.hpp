#pragma once
#include "analyzers/Rule.hpp"
#include "analyzers/ScanResult.hpp"
#include "config/ScanConfig.hpp"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

namespace skscan {

// Enumerate + analyze. Fails before any rule runs if the options or the root
// path are bad.
llvm::Expected<ScanResult> scanTree(const ScanOptions& opts, const RuleRegistry& rules);

// Full pipeline as run by the command line tool: scan, render to OS (or to
// opts.outputFile), and return the process exit status. Fatal errors are
// logged and yield 1.
int runScan(const ScanOptions& opts, const RuleRegistry& rules, llvm::raw_ostream& OS);

// Rule catalog, optionally limited to one category.
void listRules(const RuleRegistry& rules, llvm::StringRef category, llvm::raw_ostream& OS);

// Fails with ScanErrc::UnknownRule.
llvm::Error printRuleInfo(const RuleRegistry& rules, llvm::StringRef id,
                          llvm::raw_ostream& OS);

} // namespace skscan
