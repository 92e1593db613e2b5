#pragma once
#include "analyzers/Rule.hpp"
#include "analyzers/ScanResult.hpp"
#include <memory>
#include <string>
#include <vector>

namespace skscan {

// Rule ids the engine itself reports for files it could not hand to rules.
constexpr const char* ReadFailureRuleId = "SCAN001";
constexpr const char* BinaryFileRuleId  = "SCAN002";

struct AnalyzeOptions {
  unsigned jobs = 1;          // worker threads, 0 = hardware concurrency
};

class Analyzer {
public:
  virtual ~Analyzer() = default;

  // Runs every rule once on every file. Per-file problems become Low
  // findings; nothing here aborts the scan.
  virtual ScanResult analyzeFiles(const std::vector<std::string>& files) = 0;
};

// The registry is referenced, not copied; it must outlive the analyzer.
std::unique_ptr<Analyzer> makeRuleAnalyzer(const RuleRegistry& rules,
                                           const AnalyzeOptions& opts);

// Single-file building blocks, also used by tests.
std::vector<Finding> analyzeText(const RuleRegistry& rules,
                                 llvm::StringRef path, llvm::StringRef text);
std::vector<Finding> analyzeFile(const RuleRegistry& rules, llvm::StringRef path);

} // namespace skscan
