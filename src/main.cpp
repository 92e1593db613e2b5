#include "config/ScanConfig.hpp"
#include "driver/ScanDriver.hpp"
#include "rules/BuiltinRules.hpp"
#include "support/Log.hpp"

#include "llvm/Support/CommandLine.h"
#include "llvm/Support/raw_ostream.h"

using namespace skscan;

static llvm::cl::OptionCategory ToolCat("skillscan options");

static llvm::cl::opt<std::string> RootPath(
  "Path", llvm::cl::desc("Root directory of the C# tree to scan"),
  llvm::cl::value_desc("dir"), llvm::cl::cat(ToolCat));

static llvm::cl::opt<std::string> Format(
  "OutputFormat", llvm::cl::desc("Report format: console (default), json or markdown"),
  llvm::cl::value_desc("format"), llvm::cl::cat(ToolCat));

static llvm::cl::opt<std::string> OutputFile(
  "Output", llvm::cl::desc("Write the report to this file instead of stdout"),
  llvm::cl::value_desc("file"), llvm::cl::cat(ToolCat));

static llvm::cl::opt<std::string> FailOn(
  "FailOn", llvm::cl::desc("Exit with 1 if a finding at or above this severity exists: "
                           "critical (default), high, medium or low"),
  llvm::cl::value_desc("severity"), llvm::cl::cat(ToolCat));

static llvm::cl::opt<unsigned> Jobs(
  "Jobs", llvm::cl::desc("Worker threads, 0 uses every core"),
  llvm::cl::init(1), llvm::cl::cat(ToolCat));

static llvm::cl::list<std::string> Disable(
  "Disable", llvm::cl::desc("Comma separated rule ids to skip"),
  llvm::cl::CommaSeparated, llvm::cl::value_desc("ids"), llvm::cl::cat(ToolCat));

static llvm::cl::opt<std::string> Category(
  "Category", llvm::cl::desc("Only run (or list) rules of this category"),
  llvm::cl::cat(ToolCat));

static llvm::cl::opt<std::string> ConfigPath(
  "Config", llvm::cl::desc("YAML file with scan options; flags override it"),
  llvm::cl::value_desc("file"), llvm::cl::cat(ToolCat));

static llvm::cl::opt<bool> ListRules(
  "ListRules", llvm::cl::desc("List the available rules and exit"),
  llvm::cl::init(false), llvm::cl::cat(ToolCat));

static llvm::cl::opt<std::string> RuleInfo(
  "RuleInfo", llvm::cl::desc("Show details about one rule and exit"),
  llvm::cl::value_desc("id"), llvm::cl::cat(ToolCat));

static llvm::cl::opt<bool> Verbose(
  "Verbose", llvm::cl::desc("Print progress notes to stderr"),
  llvm::cl::init(false), llvm::cl::cat(ToolCat));

static int fail(llvm::Error err) {
  log::error() << llvm::toString(std::move(err)) << "\n";
  return 1;
}

int main(int argc, const char** argv) {
  llvm::cl::HideUnrelatedOptions(ToolCat);
  llvm::cl::ParseCommandLineOptions(argc, argv,
    "skillscan - checks ASP.NET Core C# sources against best-practice rules\n");
  log::setVerbose(Verbose);

  RuleRegistry rules;
  if (auto err = registerBuiltinRules(rules)) return fail(std::move(err));

  if (ListRules) {
    listRules(rules, Category, llvm::outs());
    return 0;
  }
  if (!RuleInfo.empty()) {
    if (auto err = printRuleInfo(rules, RuleInfo, llvm::outs())) return fail(std::move(err));
    return 0;
  }

  ScanConfigFile cfg;
  if (!ConfigPath.empty()) {
    auto loaded = loadConfigFile(ConfigPath);
    if (!loaded) return fail(loaded.takeError());
    cfg = std::move(*loaded);
  }

  // Only flags given explicitly override the config file
  FlagValues flags;
  flags.path = RootPath;
  if (Format.getNumOccurrences()) flags.format = Format.getValue();
  if (FailOn.getNumOccurrences()) flags.failOn = FailOn.getValue();
  if (Jobs.getNumOccurrences()) flags.jobs = Jobs.getValue();
  if (Disable.getNumOccurrences())
    flags.disabledRules = std::vector<std::string>(Disable.begin(), Disable.end());
  flags.outputFile = OutputFile;
  flags.category = Category;

  auto opts = mergeOptions(cfg, flags);
  if (!opts) return fail(opts.takeError());
  return runScan(*opts, rules, llvm::outs());
}
