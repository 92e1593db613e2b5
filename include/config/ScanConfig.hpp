#pragma once
#include "analyzers/Finding.hpp"
#include "analyzers/Rule.hpp"
#include "discovery/FileEnumerator.hpp"
#include "report/ReportFormatter.hpp"
#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include <string>
#include <vector>

namespace skscan {

struct ScanOptions {
  std::string path;                   // root of the tree to scan
  OutputFormat format = OutputFormat::Console;
  std::string outputFile;             // empty: write to stdout
  Severity failOn = Severity::Critical;
  unsigned jobs = 1;                  // 0 = hardware concurrency
  std::string category;               // empty: all categories
  std::vector<std::string> disabledRules;
  EnumerateOptions enumerate;
};

// Contents of a -Config YAML file. Absent keys leave ScanOptions untouched.
//
//   extensions:     [".cs"]
//   exclude_dirs:   [bin, obj, packages]
//   disabled_rules: [ASP008]
//   fail_on:        high
//   jobs:           4
//   output_format:  json
struct ScanConfigFile {
  llvm::Optional<std::vector<std::string>> extensions;
  llvm::Optional<std::vector<std::string>> excludeDirs;
  llvm::Optional<std::vector<std::string>> disabledRules;
  llvm::Optional<std::string> failOn;
  llvm::Optional<unsigned> jobs;
  llvm::Optional<std::string> outputFormat;
};

// Parses YAML text; sourceName is used in error messages.
// Fails with ScanErrc::InvalidConfig.
llvm::Expected<ScanConfigFile> parseConfigText(llvm::StringRef yamlText,
                                               llvm::StringRef sourceName);

// Reads and parses a config file. A missing file is ScanErrc::InvalidConfig.
llvm::Expected<ScanConfigFile> loadConfigFile(llvm::StringRef filePath);

// Overlays values present in cfg onto opts.
llvm::Error applyConfig(const ScanConfigFile& cfg, ScanOptions& opts);

// What was given on the command line. Unset fields were not passed and leave
// the config file value (or the default) in place.
struct FlagValues {
  std::string path;
  llvm::Optional<std::string> format;
  std::string outputFile;
  llvm::Optional<std::string> failOn;
  llvm::Optional<unsigned> jobs;
  llvm::Optional<std::vector<std::string>> disabledRules;
  std::string category;
};

// Defaults, overlaid by cfg, overlaid by flags. Fails with InvalidConfig when
// no path was given, and with UnknownOutputFormat or UnknownSeverity for bad
// names from either source.
llvm::Expected<ScanOptions> mergeOptions(const ScanConfigFile& cfg,
                                         const FlagValues& flags);

// Checks things the argument parser cannot: disabled rule ids exist, the
// category is known, extensions look like extensions.
llvm::Error validateOptions(const ScanOptions& opts, const RuleRegistry& rules);

} // namespace skscan
