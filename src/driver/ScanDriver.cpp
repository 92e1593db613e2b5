#include "driver/ScanDriver.hpp"
#include "analyzers/Analyzer.hpp"
#include "discovery/FileEnumerator.hpp"
#include "report/ReportFormatter.hpp"
#include "support/Log.hpp"
#include "support/ScanError.hpp"

#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Format.h"

namespace skscan {

llvm::Expected<ScanResult> scanTree(const ScanOptions& opts, const RuleRegistry& rules) {
  if (auto err = validateOptions(opts, rules)) return std::move(err);

  auto enumerator = FileEnumerator::create(opts.path, opts.enumerate);
  if (!enumerator) return enumerator.takeError();

  RuleRegistry active = rules.subset(opts.disabledRules, opts.category);
  std::vector<std::string> files = enumerator->collect();
  log::note() << files.size() << " files, " << active.size() << " rules\n";

  AnalyzeOptions aopts;
  aopts.jobs = opts.jobs;
  return makeRuleAnalyzer(active, aopts)->analyzeFiles(files);
}

int runScan(const ScanOptions& opts, const RuleRegistry& rules, llvm::raw_ostream& OS) {
  auto result = scanTree(opts, rules);
  if (!result) {
    log::error() << llvm::toString(result.takeError()) << "\n";
    return 1;
  }

  auto formatter = makeReportFormatter(opts.format, opts.path);
  if (opts.outputFile.empty()) {
    formatter->render(*result, OS);
  } else {
    std::error_code EC;
    llvm::raw_fd_ostream file(opts.outputFile, EC, llvm::sys::fs::OF_Text);
    if (EC) {
      log::error() << llvm::toString(makeScanError(
                        ScanErrc::OutputWriteFailure,
                        "cannot write report to '" + opts.outputFile + "': " + EC.message()))
                   << "\n";
      return 1;
    }
    formatter->render(*result, file);
    file.close();
    if (file.has_error()) {
      log::error() << "cannot write report to '" << opts.outputFile << "': "
                   << file.error().message() << "\n";
      file.clear_error();
      return 1;
    }
    OS << "Report saved to " << opts.outputFile << "\n";
  }
  return exitStatusFor(*result, opts.failOn);
}

static void printRuleRow(llvm::raw_ostream& OS, llvm::StringRef id, llvm::StringRef severity,
                         llvm::StringRef category, llvm::StringRef title) {
  OS << llvm::left_justify(id, 8) << ' ' << llvm::left_justify(severity, 9) << ' '
     << llvm::left_justify(category, 15) << ' ' << title << "\n";
}

void listRules(const RuleRegistry& rules, llvm::StringRef category, llvm::raw_ostream& OS) {
  printRuleRow(OS, "Rule", "Severity", "Category", "Title");
  for (const auto& r : rules.rules()) {
    if (!category.empty() && !category.equals_insensitive(r.category)) continue;
    printRuleRow(OS, r.id, severityName(r.severity), r.category, r.title);
  }
}

llvm::Error printRuleInfo(const RuleRegistry& rules, llvm::StringRef id,
                          llvm::raw_ostream& OS) {
  const RuleDescriptor* r = rules.findById(id);
  if (!r)
    return makeScanError(ScanErrc::UnknownRule, "unknown rule id '" + id + "'");
  OS << r->id << ": " << r->title << "\n\n"
     << "  Severity : " << severityName(r->severity) << "\n"
     << "  Category : " << r->category << "\n\n"
     << "  " << r->description << "\n";
  return llvm::Error::success();
}

} // namespace skscan
