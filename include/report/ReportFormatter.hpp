#pragma once
#include "analyzers/ScanResult.hpp"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"
#include <memory>
#include <string>

namespace skscan {

enum class OutputFormat { Console, Json, Markdown };

llvm::StringRef outputFormatName(OutputFormat f);   // "console", "json", "markdown"

// Case-insensitive; fails with ScanErrc::UnknownOutputFormat.
llvm::Expected<OutputFormat> parseOutputFormat(llvm::StringRef text);

class ReportFormatter {
public:
  virtual ~ReportFormatter() = default;
  virtual void render(const ScanResult& result, llvm::raw_ostream& OS) = 0;
};

// rootPath is echoed in report headers only.
std::unique_ptr<ReportFormatter> makeReportFormatter(OutputFormat format,
                                                     std::string rootPath);

// 1 if any finding is at least as severe as failOn, else 0.
int exitStatusFor(const ScanResult& result, Severity failOn);

} // namespace skscan
