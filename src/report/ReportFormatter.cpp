#include "report/ReportFormatter.hpp"
#include "support/ScanError.hpp"

#include "llvm/Support/JSON.h"
#include <cstdint>

namespace skscan {

llvm::StringRef outputFormatName(OutputFormat f) {
  switch (f) {
    case OutputFormat::Console:  return "console";
    case OutputFormat::Json:     return "json";
    case OutputFormat::Markdown: return "markdown";
  }
  return "console";
}

llvm::Expected<OutputFormat> parseOutputFormat(llvm::StringRef text) {
  llvm::StringRef t = text.trim();
  for (auto f : {OutputFormat::Console, OutputFormat::Json, OutputFormat::Markdown})
    if (t.equals_insensitive(outputFormatName(f))) return f;
  return makeScanError(ScanErrc::UnknownOutputFormat,
                       "unknown output format '" + text +
                       "' (expected console, json or markdown)");
}

int exitStatusFor(const ScanResult& result, Severity failOn) {
  return result.hasAtLeast(failOn) ? 1 : 0;
}

namespace {

llvm::raw_ostream::Colors severityColor(Severity s) {
  switch (s) {
    case Severity::Critical: return llvm::raw_ostream::RED;
    case Severity::High:     return llvm::raw_ostream::YELLOW;
    case Severity::Medium:   return llvm::raw_ostream::BLUE;
    case Severity::Low:      return llvm::raw_ostream::WHITE;
  }
  return llvm::raw_ostream::WHITE;
}

class ConsoleFormatter final : public ReportFormatter {
  std::string Root;

public:
  explicit ConsoleFormatter(std::string root) : Root(std::move(root)) {}

  void render(const ScanResult& result, llvm::raw_ostream& OS) override {
    OS << "Scan results for " << Root << " (" << result.filesScanned()
       << " files)\n\n";

    const auto& c = result.counts();
    for (Severity s : AllSeverities)
      OS << severityName(s) << ": " << c.of(s) << "\n";
    OS << "Total: " << result.total() << "\n\n";

    if (result.findings().empty()) {
      OS << "No issues found.\n";
      return;
    }

    for (const auto& f : result.findings()) {
      bool color = OS.has_colors();
      if (color) OS.changeColor(severityColor(f.severity), /*Bold=*/true);
      OS << "[" << severityName(f.severity) << "]";
      if (color) OS.resetColor();
      OS << " " << f.file << ":" << f.line << " " << f.ruleId << ": "
         << f.message << "\n";
    }
  }
};

// llvm::json requires valid UTF-8; file names and messages may not be.
std::string jsonSafe(llvm::StringRef s) {
  return llvm::json::isUTF8(s) ? s.str() : llvm::json::fixUTF8(s);
}

class JsonFormatter final : public ReportFormatter {
  std::string Root;

public:
  explicit JsonFormatter(std::string root) : Root(std::move(root)) {}

  void render(const ScanResult& result, llvm::raw_ostream& OS) override {
    const auto& c = result.counts();
    {
      llvm::json::OStream J(OS, /*IndentSize=*/2);
      J.object([&] {
        J.attribute("path", jsonSafe(Root));
        J.attribute("filesScanned", static_cast<int64_t>(result.filesScanned()));
        J.attributeObject("summary", [&] {
          J.attribute("critical", static_cast<int64_t>(c.critical));
          J.attribute("high",     static_cast<int64_t>(c.high));
          J.attribute("medium",   static_cast<int64_t>(c.medium));
          J.attribute("low",      static_cast<int64_t>(c.low));
          J.attribute("total",    static_cast<int64_t>(result.total()));
        });
        J.attributeArray("issues", [&] {
          for (const auto& f : result.findings()) {
            J.object([&] {
              J.attribute("file", jsonSafe(f.file));
              J.attribute("line", static_cast<int64_t>(f.line));
              J.attribute("rule", jsonSafe(f.ruleId));
              J.attribute("message", jsonSafe(f.message));
              J.attribute("severity", severityName(f.severity));
            });
          }
        });
      });
    }
    OS << "\n";
  }
};

class MarkdownFormatter final : public ReportFormatter {
  std::string Root;

public:
  explicit MarkdownFormatter(std::string root) : Root(std::move(root)) {}

  void render(const ScanResult& result, llvm::raw_ostream& OS) override {
    OS << "# Scan Report\n\n"
       << "**Path:** `" << Root << "`  \n"
       << "**Files scanned:** " << result.filesScanned() << "\n\n";

    const auto& c = result.counts();
    OS << "## Summary\n\n"
       << "| Severity | Count |\n"
       << "|----------|-------|\n";
    for (Severity s : AllSeverities)
      OS << "| " << severityName(s) << " | " << c.of(s) << " |\n";
    OS << "| **Total** | " << result.total() << " |\n\n";

    OS << "## Issues\n\n";
    if (result.findings().empty()) {
      OS << "No issues found.\n";
      return;
    }
    for (const auto& f : result.findings()) {
      OS << "### " << f.ruleId << ": " << f.file << ":" << f.line << "\n\n"
         << "- **Severity:** " << severityName(f.severity) << "\n"
         << "- **Message:** " << f.message << "\n\n";
    }
  }
};

} // namespace

std::unique_ptr<ReportFormatter> makeReportFormatter(OutputFormat format,
                                                     std::string rootPath) {
  switch (format) {
    case OutputFormat::Console:
      return std::make_unique<ConsoleFormatter>(std::move(rootPath));
    case OutputFormat::Json:
      return std::make_unique<JsonFormatter>(std::move(rootPath));
    case OutputFormat::Markdown:
      return std::make_unique<MarkdownFormatter>(std::move(rootPath));
  }
  return std::make_unique<ConsoleFormatter>(std::move(rootPath));
}

} // namespace skscan
