#pragma once
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include <string>

namespace skscan {

// Declared most to least severe.
enum class Severity { Critical, High, Medium, Low };

inline constexpr Severity AllSeverities[] = {
  Severity::Critical, Severity::High, Severity::Medium, Severity::Low,
};

// Higher rank is more severe.
int severityRank(Severity s);

llvm::StringRef severityName(Severity s);      // "Critical", "High", ...

// Case-insensitive; fails with ScanErrc::UnknownSeverity.
llvm::Expected<Severity> parseSeverity(llvm::StringRef text);

struct Finding {
  std::string file;
  unsigned    line = 1;       // 1-based, 1 when the rule does not track lines
  std::string ruleId;         // eg. "ASP001"
  std::string message;
  Severity    severity = Severity::Low;
};

// Orders by file, line, rule id, then message.
bool operator<(const Finding& a, const Finding& b);
bool operator==(const Finding& a, const Finding& b);
inline bool operator!=(const Finding& a, const Finding& b) { return !(a == b); }

} // namespace skscan
