#include "analyzers/Rule.hpp"
#include "support/ScanError.hpp"
#include <algorithm>

namespace skscan {

llvm::Error RuleRegistry::registerRule(RuleDescriptor rule) {
  if (rule.id.empty())
    return makeScanError(ScanErrc::InvalidConfig, "rule has no id");
  if (!rule.check)
    return makeScanError(ScanErrc::InvalidConfig,
                         "rule '" + rule.id + "' has no check function");
  if (findById(rule.id))
    return makeScanError(ScanErrc::DuplicateRule,
                         "rule id '" + rule.id + "' is already registered");
  Rules.push_back(std::move(rule));
  return llvm::Error::success();
}

const RuleDescriptor* RuleRegistry::findById(llvm::StringRef id) const {
  auto it = std::find_if(Rules.begin(), Rules.end(),
                         [id](const RuleDescriptor& r) { return id.equals_insensitive(r.id); });
  return it != Rules.end() ? &*it : nullptr;
}

RuleRegistry RuleRegistry::subset(llvm::ArrayRef<std::string> disabledIds,
                                  llvm::StringRef category) const
{
  RuleRegistry out;
  for (const auto& r : Rules) {
    bool disabled = std::any_of(disabledIds.begin(), disabledIds.end(),
                                [&](const std::string& d) {
                                  return llvm::StringRef(d).equals_insensitive(r.id);
                                });
    if (disabled) continue;
    if (!category.empty() && !category.equals_insensitive(r.category)) continue;
    out.Rules.push_back(r);
  }
  return out;
}

} // namespace skscan
