#include "analyzers/Analyzer.hpp"
#include "support/Log.hpp"
#include "support/ScanError.hpp"

#include "llvm/Support/ErrorOr.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/ThreadPool.h"
#include "llvm/Support/Threading.h"

namespace skscan {

static Finding engineFinding(llvm::StringRef path, const char* ruleId,
                             std::string message) {
  Finding f;
  f.file = path.str();
  f.line = 1;
  f.ruleId = ruleId;
  f.message = std::move(message);
  f.severity = Severity::Low;
  return f;
}

std::vector<Finding> analyzeText(const RuleRegistry& rules,
                                 llvm::StringRef path, llvm::StringRef text)
{
  std::vector<Finding> out;
  text.consume_front("\xEF\xBB\xBF");   // UTF-8 BOM

  if (text.find('\0') != llvm::StringRef::npos) {
    out.push_back(engineFinding(path, BinaryFileRuleId,
                                "file looks binary (contains NUL bytes); rules skipped"));
    return out;
  }

  for (const auto& rule : rules.rules()) {
    for (auto& f : rule.check(path, text)) {
      // Rules may leave bookkeeping fields blank
      if (f.file.empty()) f.file = path.str();
      if (f.ruleId.empty()) f.ruleId = rule.id;
      if (f.line == 0) f.line = 1;
      out.push_back(std::move(f));
    }
  }
  return out;
}

static llvm::Expected<std::unique_ptr<llvm::MemoryBuffer>>
readSourceFile(llvm::StringRef path) {
  auto bufOrErr = llvm::MemoryBuffer::getFile(path, /*IsText=*/false,
                                              /*RequiresNullTerminator=*/false);
  if (!bufOrErr)
    return makeScanError(ScanErrc::FileReadFailure,
                         "file could not be read: " + bufOrErr.getError().message());
  return std::move(*bufOrErr);
}

std::vector<Finding> analyzeFile(const RuleRegistry& rules, llvm::StringRef path) {
  auto buf = readSourceFile(path);
  if (!buf) {
    // A file that cannot be read is reported, not fatal
    std::vector<Finding> out;
    llvm::handleAllErrors(buf.takeError(), [&](const llvm::ErrorInfoBase& E) {
      out.push_back(engineFinding(path, ReadFailureRuleId, E.message()));
    });
    return out;
  }
  return analyzeText(rules, path, (*buf)->getBuffer());
}

namespace {

class RuleAnalyzerImpl final : public Analyzer {
  const RuleRegistry& Rules;
  AnalyzeOptions Opts;

public:
  RuleAnalyzerImpl(const RuleRegistry& rules, const AnalyzeOptions& opts)
    : Rules(rules), Opts(opts) {}

  ScanResult analyzeFiles(const std::vector<std::string>& files) override {
    // One slot per file; workers never share a slot, so no locking
    std::vector<std::vector<Finding>> slots(files.size());

    if (Opts.jobs == 1 || files.size() < 2) {
      for (std::size_t i = 0; i < files.size(); ++i) {
        log::note() << "scanning " << files[i] << "\n";
        slots[i] = analyzeFile(Rules, files[i]);
      }
    } else {
      llvm::ThreadPool Pool(llvm::hardware_concurrency(Opts.jobs));
      log::note() << "scanning " << files.size() << " files on "
                  << Pool.getThreadCount() << " threads\n";
      for (std::size_t i = 0; i < files.size(); ++i) {
        Pool.async([this, &files, &slots, i] {
          slots[i] = analyzeFile(Rules, files[i]);
        });
      }
      Pool.wait();
    }

    std::vector<Finding> all;
    for (auto& slot : slots) {
      for (auto& f : slot) {
        if (f.ruleId == ReadFailureRuleId || f.ruleId == BinaryFileRuleId)
          log::warning() << f.file << ": " << f.message << "\n";
        all.push_back(std::move(f));
      }
    }
    return ScanResult(std::move(all), files.size());
  }
};

} // namespace

std::unique_ptr<Analyzer> makeRuleAnalyzer(const RuleRegistry& rules,
                                           const AnalyzeOptions& opts) {
  return std::make_unique<RuleAnalyzerImpl>(rules, opts);
}

} // namespace skscan
