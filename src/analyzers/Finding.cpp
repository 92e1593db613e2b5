#include "analyzers/Finding.hpp"
#include "support/ScanError.hpp"
#include <tuple>

namespace skscan {

int severityRank(Severity s) {
  switch (s) {
    case Severity::Critical: return 3;
    case Severity::High:     return 2;
    case Severity::Medium:   return 1;
    case Severity::Low:      return 0;
  }
  return 0;
}

llvm::StringRef severityName(Severity s) {
  switch (s) {
    case Severity::Critical: return "Critical";
    case Severity::High:     return "High";
    case Severity::Medium:   return "Medium";
    case Severity::Low:      return "Low";
  }
  return "Unknown";
}

llvm::Expected<Severity> parseSeverity(llvm::StringRef text) {
  llvm::StringRef t = text.trim();
  for (Severity s : AllSeverities)
    if (t.equals_insensitive(severityName(s))) return s;
  return makeScanError(ScanErrc::UnknownSeverity,
                       "unknown severity '" + text +
                       "' (expected critical, high, medium or low)");
}

bool operator<(const Finding& a, const Finding& b) {
  return std::tie(a.file, a.line, a.ruleId, a.message) <
         std::tie(b.file, b.line, b.ruleId, b.message);
}

bool operator==(const Finding& a, const Finding& b) {
  return a.file == b.file && a.line == b.line && a.ruleId == b.ruleId &&
         a.message == b.message && a.severity == b.severity;
}

} // namespace skscan
