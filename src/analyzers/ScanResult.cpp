#include "analyzers/ScanResult.hpp"
#include <algorithm>

namespace skscan {

std::size_t SeverityCounts::of(Severity s) const {
  switch (s) {
    case Severity::Critical: return critical;
    case Severity::High:     return high;
    case Severity::Medium:   return medium;
    case Severity::Low:      return low;
  }
  return 0;
}

ScanResult::ScanResult(std::vector<Finding> findings, std::size_t filesScanned)
  : Findings(std::move(findings)), FilesScanned(filesScanned)
{
  std::stable_sort(Findings.begin(), Findings.end());
  for (const auto& f : Findings) {
    switch (f.severity) {
      case Severity::Critical: ++Counts.critical; break;
      case Severity::High:     ++Counts.high;     break;
      case Severity::Medium:   ++Counts.medium;   break;
      case Severity::Low:      ++Counts.low;      break;
    }
  }
}

bool ScanResult::hasAtLeast(Severity threshold) const {
  std::optional<Severity> worst = worstSeverity();
  return worst && severityRank(*worst) >= severityRank(threshold);
}

std::optional<Severity> ScanResult::worstSeverity() const {
  for (Severity s : AllSeverities)
    if (Counts.of(s) > 0) return s;
  return std::nullopt;
}

} // namespace skscan
