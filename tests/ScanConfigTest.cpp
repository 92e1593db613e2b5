#include "config/ScanConfig.hpp"
#include "rules/BuiltinRules.hpp"
#include "support/ScanError.hpp"
#include "TestTree.hpp"
#include <gtest/gtest.h>

using namespace skscan;
using skscan::test::TestTree;

TEST(ScanConfigTest, ParsesAllKeys) {
  auto cfg = parseConfigText("extensions: [cs, .cshtml]\n"
                             "exclude_dirs:\n"
                             "  - bin\n"
                             "  - artifacts\n"
                             "disabled_rules: [ASP008]\n"
                             "fail_on: high\n"
                             "jobs: 4\n"
                             "output_format: markdown\n",
                             "inline");
  ASSERT_TRUE(static_cast<bool>(cfg)) << llvm::toString(cfg.takeError());
  ASSERT_TRUE(cfg->extensions.hasValue());
  EXPECT_EQ(2u, cfg->extensions->size());
  ASSERT_TRUE(cfg->excludeDirs.hasValue());
  EXPECT_EQ((std::vector<std::string>{"bin", "artifacts"}), *cfg->excludeDirs);
  EXPECT_EQ(4u, cfg->jobs.getValue());

  ScanOptions opts;
  ASSERT_FALSE(static_cast<bool>(applyConfig(*cfg, opts)));
  EXPECT_EQ((std::vector<std::string>{".cs", ".cshtml"}), opts.enumerate.extensions);
  EXPECT_EQ((std::vector<std::string>{"bin", "artifacts"}), opts.enumerate.excludedDirs);
  EXPECT_EQ((std::vector<std::string>{"ASP008"}), opts.disabledRules);
  EXPECT_EQ(Severity::High, opts.failOn);
  EXPECT_EQ(4u, opts.jobs);
  EXPECT_EQ(OutputFormat::Markdown, opts.format);
}

TEST(ScanConfigTest, AbsentKeysKeepDefaults) {
  auto cfg = parseConfigText("jobs: 2\n", "inline");
  ASSERT_TRUE(static_cast<bool>(cfg));
  ScanOptions opts;
  ASSERT_FALSE(static_cast<bool>(applyConfig(*cfg, opts)));
  EXPECT_EQ(2u, opts.jobs);
  EXPECT_EQ(Severity::Critical, opts.failOn);
  EXPECT_EQ(OutputFormat::Console, opts.format);
  EXPECT_EQ(EnumerateOptions().excludedDirs, opts.enumerate.excludedDirs);
}

TEST(ScanConfigTest, EmptyDocumentLeavesOptionsAlone) {
  for (const char* text : {"", "# comment only\n", "---\n"}) {
    auto cfg = parseConfigText(text, "inline");
    ASSERT_TRUE(static_cast<bool>(cfg)) << llvm::toString(cfg.takeError());
    EXPECT_FALSE(cfg->failOn.hasValue());
    EXPECT_FALSE(cfg->extensions.hasValue());
    EXPECT_FALSE(cfg->outputFormat.hasValue());

    ScanOptions opts;
    ASSERT_FALSE(static_cast<bool>(applyConfig(*cfg, opts))) << text;
    EXPECT_EQ(EnumerateOptions().extensions, opts.enumerate.extensions);
    EXPECT_EQ(Severity::Critical, opts.failOn);
    EXPECT_EQ(OutputFormat::Console, opts.format);
  }
}

TEST(ScanConfigTest, UnknownKeyIsInvalid) {
  auto cfg = parseConfigText("fail_onn: high\n", "inline");
  ASSERT_FALSE(static_cast<bool>(cfg));
  EXPECT_EQ(ScanErrc::InvalidConfig, takeErrorKind(cfg.takeError()));
}

TEST(ScanConfigTest, BadValuesRejectedOnApply) {
  ScanOptions opts;
  auto badSev = parseConfigText("fail_on: fatal\n", "inline");
  ASSERT_TRUE(static_cast<bool>(badSev));
  EXPECT_EQ(ScanErrc::UnknownSeverity, takeErrorKind(applyConfig(*badSev, opts)));

  auto badFmt = parseConfigText("output_format: xml\n", "inline");
  ASSERT_TRUE(static_cast<bool>(badFmt));
  EXPECT_EQ(ScanErrc::UnknownOutputFormat, takeErrorKind(applyConfig(*badFmt, opts)));
}

TEST(ScanConfigTest, LoadsFromFile) {
  TestTree tree;
  std::string path = tree.write(".skillscan.yaml", "fail_on: medium\n");
  auto cfg = loadConfigFile(path);
  ASSERT_TRUE(static_cast<bool>(cfg));
  EXPECT_EQ(std::string("medium"), cfg->failOn.getValue());

  auto missing = loadConfigFile(tree.path("nope.yaml"));
  ASSERT_FALSE(static_cast<bool>(missing));
  EXPECT_EQ(ScanErrc::InvalidConfig, takeErrorKind(missing.takeError()));
}

TEST(MergeOptionsTest, FlagsOverrideConfigValues) {
  auto cfg = parseConfigText("fail_on: high\n"
                             "jobs: 4\n"
                             "output_format: markdown\n"
                             "disabled_rules: [ASP008]\n",
                             "inline");
  ASSERT_TRUE(static_cast<bool>(cfg));

  FlagValues flags;
  flags.path = "src";
  flags.format = std::string("json");
  flags.jobs = 2u;
  auto opts = mergeOptions(*cfg, flags);
  ASSERT_TRUE(static_cast<bool>(opts)) << llvm::toString(opts.takeError());
  EXPECT_EQ("src", opts->path);
  EXPECT_EQ(OutputFormat::Json, opts->format);
  EXPECT_EQ(2u, opts->jobs);
  // Not given on the command line: config wins
  EXPECT_EQ(Severity::High, opts->failOn);
  EXPECT_EQ((std::vector<std::string>{"ASP008"}), opts->disabledRules);

  flags.failOn = std::string("LOW");
  flags.disabledRules = std::vector<std::string>{};
  opts = mergeOptions(*cfg, flags);
  ASSERT_TRUE(static_cast<bool>(opts));
  EXPECT_EQ(Severity::Low, opts->failOn);
  EXPECT_TRUE(opts->disabledRules.empty());
}

TEST(MergeOptionsTest, DefaultsWithoutConfig) {
  FlagValues flags;
  flags.path = "proj";
  auto opts = mergeOptions(ScanConfigFile(), flags);
  ASSERT_TRUE(static_cast<bool>(opts));
  EXPECT_EQ(OutputFormat::Console, opts->format);
  EXPECT_EQ(Severity::Critical, opts->failOn);
  EXPECT_EQ(1u, opts->jobs);
  EXPECT_TRUE(opts->outputFile.empty());
}

TEST(MergeOptionsTest, RejectsMissingPathAndBadNames) {
  FlagValues noPath;
  auto missing = mergeOptions(ScanConfigFile(), noPath);
  ASSERT_FALSE(static_cast<bool>(missing));
  EXPECT_EQ(ScanErrc::InvalidConfig, takeErrorKind(missing.takeError()));

  FlagValues badFormat;
  badFormat.path = "proj";
  badFormat.format = std::string("xml");
  auto fmt = mergeOptions(ScanConfigFile(), badFormat);
  ASSERT_FALSE(static_cast<bool>(fmt));
  EXPECT_EQ(ScanErrc::UnknownOutputFormat, takeErrorKind(fmt.takeError()));

  FlagValues badSeverity;
  badSeverity.path = "proj";
  badSeverity.failOn = std::string("fatal");
  auto sev = mergeOptions(ScanConfigFile(), badSeverity);
  ASSERT_FALSE(static_cast<bool>(sev));
  EXPECT_EQ(ScanErrc::UnknownSeverity, takeErrorKind(sev.takeError()));
}

TEST(ValidateOptionsTest, ChecksRuleIdsCategoriesAndExtensions) {
  RuleRegistry rules;
  ASSERT_FALSE(static_cast<bool>(registerBuiltinRules(rules)));

  ScanOptions ok;
  ok.disabledRules = {"asp001"};
  ok.category = "Async";
  EXPECT_FALSE(static_cast<bool>(validateOptions(ok, rules)));

  ScanOptions badRule;
  badRule.disabledRules = {"ASP999"};
  EXPECT_EQ(ScanErrc::UnknownRule, takeErrorKind(validateOptions(badRule, rules)));

  ScanOptions badCategory;
  badCategory.category = "performance";
  EXPECT_EQ(ScanErrc::InvalidConfig, takeErrorKind(validateOptions(badCategory, rules)));

  ScanOptions noExt;
  noExt.enumerate.extensions.clear();
  EXPECT_EQ(ScanErrc::InvalidConfig, takeErrorKind(validateOptions(noExt, rules)));
}
