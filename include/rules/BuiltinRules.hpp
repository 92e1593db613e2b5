#pragma once
#include "analyzers/Rule.hpp"
#include "llvm/ADT/STLFunctionalExtras.h"
#include "llvm/Support/Error.h"

namespace skscan {

// Builds a line-oriented rule: every non-comment line matching the POSIX
// extended regex `pattern` yields one finding at that line. Fails with
// ScanErrc::InvalidConfig if the pattern does not compile.
llvm::Expected<RuleDescriptor>
makePatternRule(std::string id, std::string title, std::string category,
                Severity severity, std::string description,
                std::string pattern, std::string message,
                bool ignoreCase = false);

// Visits each line that still holds code once comments are removed, with its
// 1-based number. fn receives the line with // tails and /* */ spans
// stripped; string and char literals are kept verbatim, so comment markers
// inside them do not count.
void forEachCodeLine(llvm::StringRef text,
                     llvm::function_ref<void(unsigned, llvm::StringRef)> fn);

// Registers ASP001..ASP008 (see -ListRules).
llvm::Error registerBuiltinRules(RuleRegistry& registry);

} // namespace skscan
