#include "config/ScanConfig.hpp"
#include "support/ScanError.hpp"

#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/SourceMgr.h"
#include "llvm/Support/YAMLTraits.h"
#include <algorithm>

namespace llvm {
namespace yaml {

template <> struct MappingTraits<skscan::ScanConfigFile> {
  static void mapping(IO& io, skscan::ScanConfigFile& cfg) {
    io.mapOptional("extensions", cfg.extensions);
    io.mapOptional("exclude_dirs", cfg.excludeDirs);
    io.mapOptional("disabled_rules", cfg.disabledRules);
    io.mapOptional("fail_on", cfg.failOn);
    io.mapOptional("jobs", cfg.jobs);
    io.mapOptional("output_format", cfg.outputFormat);
  }
};

} // namespace yaml
} // namespace llvm

namespace skscan {

static void captureYamlDiag(const llvm::SMDiagnostic& diag, void* ctx) {
  auto* first = static_cast<std::string*>(ctx);
  if (first->empty())
    *first = "line " + std::to_string(diag.getLineNo()) + ": " + diag.getMessage().str();
}

llvm::Expected<ScanConfigFile> parseConfigText(llvm::StringRef yamlText,
                                               llvm::StringRef sourceName)
{
  ScanConfigFile cfg;
  std::string diag;
  llvm::yaml::Input yin(yamlText, /*Ctxt=*/nullptr, captureYamlDiag, &diag);
  // An empty or comment-only file has no document. Mapping it anyway would
  // engage every optional with an empty value.
  if (yin.setCurrentDocument())
    yin >> cfg;
  if (yin.error()) {
    if (diag.empty()) diag = yin.error().message();
    return makeScanError(ScanErrc::InvalidConfig,
                         "invalid config '" + sourceName + "': " + diag);
  }
  return cfg;
}

llvm::Expected<ScanConfigFile> loadConfigFile(llvm::StringRef filePath) {
  auto bufOrErr = llvm::MemoryBuffer::getFile(filePath, /*IsText=*/true);
  if (!bufOrErr)
    return makeScanError(ScanErrc::InvalidConfig,
                         "cannot read config file '" + filePath + "': " +
                         bufOrErr.getError().message());
  return parseConfigText((*bufOrErr)->getBuffer(), filePath);
}

static std::string normalizeExtension(llvm::StringRef ext) {
  ext = ext.trim();
  if (ext.startswith(".")) return ext.str();
  return "." + ext.str();
}

llvm::Error applyConfig(const ScanConfigFile& cfg, ScanOptions& opts) {
  if (cfg.extensions) {
    opts.enumerate.extensions.clear();
    for (const auto& e : *cfg.extensions)
      opts.enumerate.extensions.push_back(normalizeExtension(e));
  }
  if (cfg.excludeDirs) opts.enumerate.excludedDirs = *cfg.excludeDirs;
  if (cfg.disabledRules) opts.disabledRules = *cfg.disabledRules;
  if (cfg.jobs) opts.jobs = *cfg.jobs;

  if (cfg.failOn) {
    auto sev = parseSeverity(*cfg.failOn);
    if (!sev) return sev.takeError();
    opts.failOn = *sev;
  }
  if (cfg.outputFormat) {
    auto fmt = parseOutputFormat(*cfg.outputFormat);
    if (!fmt) return fmt.takeError();
    opts.format = *fmt;
  }
  return llvm::Error::success();
}

llvm::Expected<ScanOptions> mergeOptions(const ScanConfigFile& cfg,
                                         const FlagValues& flags)
{
  ScanOptions opts;
  if (auto err = applyConfig(cfg, opts)) return std::move(err);

  if (flags.format) {
    auto fmt = parseOutputFormat(*flags.format);
    if (!fmt) return fmt.takeError();
    opts.format = *fmt;
  }
  if (flags.failOn) {
    auto sev = parseSeverity(*flags.failOn);
    if (!sev) return sev.takeError();
    opts.failOn = *sev;
  }
  if (flags.jobs) opts.jobs = *flags.jobs;
  if (flags.disabledRules) opts.disabledRules = *flags.disabledRules;
  opts.outputFile = flags.outputFile;
  opts.category = flags.category;

  if (flags.path.empty())
    return makeScanError(ScanErrc::InvalidConfig,
                         "no -Path given; pass the directory to scan");
  opts.path = flags.path;
  return opts;
}

llvm::Error validateOptions(const ScanOptions& opts, const RuleRegistry& rules) {
  for (const auto& id : opts.disabledRules)
    if (!rules.findById(id))
      return makeScanError(ScanErrc::UnknownRule, "unknown rule id '" + id + "'");

  if (!opts.category.empty()) {
    llvm::StringRef cat = opts.category;
    bool known = std::any_of(rules.rules().begin(), rules.rules().end(),
                             [cat](const RuleDescriptor& r) {
                               return cat.equals_insensitive(r.category);
                             });
    if (!known)
      return makeScanError(ScanErrc::InvalidConfig,
                           "unknown rule category '" + opts.category + "'");
  }

  if (opts.enumerate.extensions.empty())
    return makeScanError(ScanErrc::InvalidConfig, "no file extensions to scan");
  for (const auto& e : opts.enumerate.extensions)
    if (e.size() < 2 || e[0] != '.')
      return makeScanError(ScanErrc::InvalidConfig,
                           "invalid file extension '" + e + "'");
  return llvm::Error::success();
}

} // namespace skscan
