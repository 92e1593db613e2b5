#include "rules/BuiltinRules.hpp"
#include "support/ScanError.hpp"

#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/Regex.h"
#include <string>
#include <tuple>

namespace skscan {

namespace {

enum class LexState { Code, BlockComment, VerbatimString };

// Copies a "..." or '...' literal starting at line[i] into code, honouring
// backslash escapes. Leaves i on the closing quote (or past the end).
void copyQuoted(llvm::StringRef line, std::size_t& i, std::string& code) {
  const char quote = line[i];
  code += quote;
  for (++i; i < line.size(); ++i) {
    code += line[i];
    if (line[i] == '\\' && i + 1 < line.size()) {
      code += line[++i];
      continue;
    }
    if (line[i] == quote) return;
  }
}

} // namespace

void forEachCodeLine(llvm::StringRef text,
                     llvm::function_ref<void(unsigned, llvm::StringRef)> fn)
{
  LexState state = LexState::Code;
  unsigned lineNo = 0;
  std::string code;
  while (!text.empty()) {
    llvm::StringRef line;
    std::tie(line, text) = text.split('\n');
    ++lineNo;
    line = line.rtrim('\r');

    code.clear();
    for (std::size_t i = 0; i < line.size(); ++i) {
      const char c = line[i];
      const char next = i + 1 < line.size() ? line[i + 1] : '\0';

      if (state == LexState::BlockComment) {
        if (c == '*' && next == '/') {
          state = LexState::Code;
          code += ' ';
          ++i;
        }
        continue;
      }
      if (state == LexState::VerbatimString) {
        code += c;
        if (c == '"') {
          if (next == '"') {
            code += next;
            ++i;
          } else {
            state = LexState::Code;
          }
        }
        continue;
      }

      if (c == '/' && next == '/') break;
      if (c == '/' && next == '*') {
        state = LexState::BlockComment;
        ++i;
        continue;
      }
      // @"..." and @$"..." may span lines; "" is the only escape
      if (c == '@' && (next == '"' || (next == '$' && line.substr(i + 2).startswith("\"")))) {
        code += line.substr(i, next == '"' ? 2 : 3).str();
        i += next == '"' ? 1 : 2;
        state = LexState::VerbatimString;
        continue;
      }
      if (c == '"' || c == '\'') {
        copyQuoted(line, i, code);
        continue;
      }
      code += c;
    }

    if (!llvm::StringRef(code).trim().empty())
      fn(lineNo, code);
  }
}

llvm::Expected<RuleDescriptor>
makePatternRule(std::string id, std::string title, std::string category,
                Severity severity, std::string description,
                std::string pattern, std::string message, bool ignoreCase)
{
  const auto flags = ignoreCase ? llvm::Regex::IgnoreCase : llvm::Regex::NoFlags;
  std::string err;
  if (!llvm::Regex(pattern, flags).isValid(err))
    return makeScanError(ScanErrc::InvalidConfig,
                         "rule '" + id + "': bad pattern: " + err);

  RuleDescriptor rule;
  rule.id = id;
  rule.title = std::move(title);
  rule.category = std::move(category);
  rule.severity = severity;
  rule.description = std::move(description);
  // The regex is compiled per call so the check owns no shared mutable state
  rule.check = [id, severity, pattern, message, flags](llvm::StringRef path,
                                                       llvm::StringRef text) {
    std::vector<Finding> out;
    llvm::Regex re(pattern, flags);
    forEachCodeLine(text, [&](unsigned lineNo, llvm::StringRef line) {
      if (!re.match(line)) return;
      Finding f;
      f.file = path.str();
      f.line = lineNo;
      f.ruleId = id;
      f.message = message;
      f.severity = severity;
      out.push_back(std::move(f));
    });
    return out;
  };
  return rule;
}

// ASP005 needs more than one line: the attribute usually sits above the class,
// possibly with other attributes in between, or is applied assembly-wide.
static std::vector<Finding> checkApiControllerAttribute(llvm::StringRef path,
                                                        llvm::StringRef text)
{
  llvm::Regex assemblyAttr("\\[[[:space:]]*assembly[[:space:]]*:[[:space:]]*"
                           "ApiController");
  llvm::Regex classAttr("[[,][[:space:]]*ApiController(Attribute)?[[:space:]]*[],(]");
  llvm::Regex classDecl("class[[:space:]]+([[:alnum:]_]+)[[:space:]]*:"
                        "[[:space:]]*ControllerBase([^[:alnum:]_]|$)");

  std::vector<Finding> out;
  bool assemblyWide = false;
  bool attributed = false;   // [ApiController] seen since the last declaration
  forEachCodeLine(text, [&](unsigned lineNo, llvm::StringRef line) {
    if (assemblyAttr.match(line)) {
      assemblyWide = true;
      return;
    }
    if (classAttr.match(line)) attributed = true;

    llvm::SmallVector<llvm::StringRef, 3> m;
    if (classDecl.match(line, &m)) {
      if (!attributed) {
        Finding f;
        f.file = path.str();
        f.line = lineNo;
        f.ruleId = "ASP005";
        f.message = "controller '" + m[1].str() +
                    "' derives from ControllerBase without [ApiController]";
        f.severity = Severity::Medium;
        out.push_back(std::move(f));
      }
      attributed = false;
      return;
    }
    // Anything but another attribute line detaches a pending attribute
    if (!line.ltrim().startswith("[")) attributed = false;
  });

  if (assemblyWide) out.clear();
  return out;
}

llvm::Error registerBuiltinRules(RuleRegistry& registry) {
  struct PatternSpec {
    const char* id;
    const char* title;
    const char* category;
    Severity    severity;
    const char* description;
    const char* pattern;
    const char* message;
    bool        ignoreCase;
  };

  static const PatternSpec specs[] = {
    {"ASP001", "Hard-coded secret", "security", Severity::Critical,
     "Passwords, API keys and connection strings belong in configuration or a "
     "secret store (user-secrets, Key Vault), never in source.",
     "(password|passwd|pwd|secret|apikey|api_key|accesskey|connectionstring)"
     "[[:alnum:]_]*\"?[[:space:]]*(=|:)[[:space:]]*@?\"[^\"]{4,}\"",
     "possible hard-coded secret; move it to configuration or a secret store",
     true},
    {"ASP002", "Raw SQL built from strings", "security", Severity::Critical,
     "FromSqlRaw/ExecuteSqlRaw with an interpolated or concatenated string is "
     "open to SQL injection. Use FromSqlInterpolated or parameters.",
     "(FromSqlRaw|ExecuteSqlRaw)(Async)?[[:space:]]*\\([[:space:]]*"
     "(\\$|[^)]*\"[[:space:]]*\\+)",
     "raw SQL built from an interpolated or concatenated string (SQL injection risk)",
     false},
    {"ASP003", "Sync-over-async", "async", Severity::High,
     "Blocking on a Task with .Result, .Wait() or GetAwaiter().GetResult() "
     "starves the thread pool under load. Await the task instead.",
     "\\.Result([^[:alnum:]_(]|$)|\\.Wait\\([[:space:]]*\\)|"
     "\\.GetAwaiter\\(\\)\\.GetResult\\(\\)",
     "blocking wait on an async operation; use await",
     false},
    {"ASP004", "async void method", "async", Severity::High,
     "async void methods cannot be awaited and their exceptions crash the "
     "process. Return Task unless this is an event handler.",
     "async[[:space:]]+void[[:space:]]+[[:alnum:]_]+[[:space:]]*\\(",
     "async void method; return Task instead",
     false},
    {"ASP006", "HttpClient constructed directly", "resilience", Severity::Medium,
     "Creating HttpClient per call exhausts sockets. Inject IHttpClientFactory "
     "or a typed client.",
     "new[[:space:]]+HttpClient[[:space:]]*\\(",
     "HttpClient created with new; use IHttpClientFactory",
     false},
    {"ASP007", "Empty catch block", "error-handling", Severity::Medium,
     "Swallowed exceptions hide failures. Log and rethrow, or handle the "
     "specific exception type.",
     "catch[[:space:]]*(\\([^)]*\\))?[[:space:]]*\\{[[:space:]]*\\}",
     "empty catch block swallows exceptions",
     false},
    {"ASP008", "Console output in application code", "logging", Severity::Low,
     "Use ILogger<T> so output is structured and routed by the host's "
     "logging configuration.",
     "Console\\.(Write|WriteLine)[[:space:]]*\\(",
     "Console output; use ILogger instead",
     false},
  };

  for (const auto& s : specs) {
    auto rule = makePatternRule(s.id, s.title, s.category, s.severity,
                                s.description, s.pattern, s.message, s.ignoreCase);
    if (!rule) return rule.takeError();
    if (auto err = registry.registerRule(std::move(*rule))) return err;
  }

  RuleDescriptor controller;
  controller.id = "ASP005";
  controller.title = "Controller without [ApiController]";
  controller.category = "api-design";
  controller.severity = Severity::Medium;
  controller.description =
    "[ApiController] enables automatic 400 responses for invalid models and "
    "binding-source inference. Apply it to the class or the assembly.";
  controller.check = checkApiControllerAttribute;
  return registry.registerRule(std::move(controller));
}

} // namespace skscan
