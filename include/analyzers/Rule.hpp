#pragma once
#include "analyzers/Finding.hpp"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include <functional>
#include <string>
#include <vector>

namespace skscan {

// A rule sees one file at a time and must not keep state between calls:
// the analyzer may run it on several files concurrently.
using RuleFn = std::function<std::vector<Finding>(llvm::StringRef path,
                                                  llvm::StringRef text)>;

struct RuleDescriptor {
  std::string id;             // eg. "ASP003", unique within a registry
  std::string title;          // one-line summary for listings
  std::string category;       // eg. "security", "async"
  Severity    severity = Severity::Medium;
  std::string description;    // longer text shown by -RuleInfo
  RuleFn      check;
};

class RuleRegistry {
public:
  // Fails with ScanErrc::DuplicateRule if the id is taken, or
  // ScanErrc::InvalidConfig if the rule has no id or no check.
  llvm::Error registerRule(RuleDescriptor rule);

  const RuleDescriptor* findById(llvm::StringRef id) const;

  const std::vector<RuleDescriptor>& rules() const { return Rules; }
  std::size_t size() const { return Rules.size(); }
  bool empty() const { return Rules.empty(); }

  // Copy keeping only rules not listed in disabledIds and, when category is
  // non-empty, belonging to that category (case-insensitive).
  RuleRegistry subset(llvm::ArrayRef<std::string> disabledIds,
                      llvm::StringRef category) const;

private:
  std::vector<RuleDescriptor> Rules;
};

} // namespace skscan
