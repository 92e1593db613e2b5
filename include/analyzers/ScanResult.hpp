#pragma once
#include "analyzers/Finding.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace skscan {

struct SeverityCounts {
  std::size_t critical = 0;
  std::size_t high = 0;
  std::size_t medium = 0;
  std::size_t low = 0;

  std::size_t of(Severity s) const;
  std::size_t total() const { return critical + high + medium + low; }
};

// Everything one invocation found. Built once by the analyzer, read-only
// afterwards; findings are kept sorted so output never depends on the order
// in which files or workers finished.
class ScanResult {
public:
  ScanResult() = default;
  ScanResult(std::vector<Finding> findings, std::size_t filesScanned);

  const std::vector<Finding>& findings() const { return Findings; }
  const SeverityCounts& counts() const { return Counts; }
  std::size_t total() const { return Findings.size(); }
  std::size_t filesScanned() const { return FilesScanned; }

  // True if any finding is at least as severe as threshold.
  bool hasAtLeast(Severity threshold) const;
  std::optional<Severity> worstSeverity() const;

private:
  std::vector<Finding> Findings;
  SeverityCounts       Counts;
  std::size_t          FilesScanned = 0;
};

} // namespace skscan
