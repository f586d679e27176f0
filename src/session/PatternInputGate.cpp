#include "PatternInputGate.hpp"

namespace pd {
namespace {
const auto FLAGS = std::regex::ECMAScript | std::regex::icase;

InjectionPattern makePattern(const string& category,
                             InjectionSeverity severity, const string& re,
                             bool perLine = false) {
  return {category, severity, std::regex(re, FLAGS), perLine};
}
}  // namespace

PatternInputGate::PatternInputGate(bool _strict)
    : patterns(defaultPatterns()),
      quickPatterns(defaultQuickPatterns()),
      strict(_strict) {}

PatternInputGate::PatternInputGate(const vector<InjectionPattern>& _patterns,
                                   const vector<std::regex>& _quickPatterns,
                                   bool _strict)
    : patterns(_patterns), quickPatterns(_quickPatterns), strict(_strict) {}

vector<InjectionPattern> PatternInputGate::defaultPatterns() {
  const auto C = InjectionSeverity::CRITICAL;
  const auto H = InjectionSeverity::HIGH;
  const auto M = InjectionSeverity::MEDIUM;
  return {
      makePattern("instruction_override", C,
                  "ignore\\s+(all\\s+)?(previous|prior|above|earlier)\\s+"
                  "(instructions?|prompts?|rules?|context)"),
      makePattern("instruction_override", C,
                  "disregard\\s+(all\\s+)?(previous|prior|above|earlier)\\s+"
                  "(instructions?|prompts?|rules?)"),
      makePattern("instruction_override", C,
                  "override\\s+(your\\s+)?(instructions?|programming|rules?|"
                  "guidelines?)"),
      makePattern("instruction_override", C,
                  "new\\s+instructions?:\\s*you\\s+(are|will|must|should)"),
      makePattern("ai_impersonation", C,
                  "you\\s+are\\s+now\\s+(a\\s+)?(different|new|another)\\s+"
                  "(ai|assistant|model|system)"),
      makePattern("ai_impersonation", H,
                  "pretend\\s+(to\\s+be|you('re|\\s+are))\\s+(a\\s+)?"
                  "(different|another|new)"),
      makePattern("ai_impersonation", C,
                  "rolep?lay\\s+as\\s+(a\\s+)?(malicious|evil|unfiltered|"
                  "jailbroken)"),
      makePattern("system_prompt_access", H,
                  "(show|reveal|display|print|output)\\s+(me\\s+)?(your\\s+)?"
                  "(system\\s+)?prompt"),
      makePattern("system_prompt_access", M,
                  "what\\s+(are|is)\\s+your\\s+(system\\s+)?(instructions?|"
                  "prompt|rules?)"),
      makePattern("system_prompt_access", C,
                  "dump\\s+(your\\s+)?(system|initial|original)\\s+"
                  "(prompt|instructions?)"),
      makePattern("system_prefix", H, "^\\s*SYSTEM\\s*:", true),
      makePattern("system_prefix", H, "^\\s*\\[SYSTEM\\]", true),
      makePattern("system_prefix", H, "^\\s*<system>", true),
      makePattern("system_prefix", H, "^\\s*<<SYS>>", true),
      makePattern("role_hijacking", C,
                  "entering\\s+(developer|admin|root|sudo|god)\\s+mode"),
      makePattern("role_hijacking", C,
                  "activate\\s+(dan|jailbreak|unrestricted)\\s+mode"),
      makePattern("context_manipulation", M,
                  "end\\s+of\\s+(system\\s+)?(prompt|instructions?|context)"),
      makePattern("code_injection", C,
                  "import\\s+os\\s*;?\\s*os\\.(system|popen|exec)"),
      makePattern("code_injection", C,
                  "require\\s*\\(\\s*['\"]child_process['\"]\\s*\\)"),
  };
}

vector<std::regex> PatternInputGate::defaultQuickPatterns() {
  // Deliberately loose: anything with these words goes to the full analysis.
  return {
      std::regex("ignore|disregard|override|instruction|rules?", FLAGS),
      std::regex("you\\s+are\\s+now|pretend|rolep?lay", FLAGS),
      std::regex("prompt|system|<<sys>>", FLAGS),
      std::regex("mode|jailbreak|end\\s+of", FLAGS),
      std::regex("import\\s+os|child_process", FLAGS),
  };
}

bool PatternInputGate::quickCheck(const string& input) {
  string text = RegexUtils::collapseWhitespace(input);
  for (const auto& it : quickPatterns) {
    if (RegexUtils::searchWindowed(text, it)) {
      return false;
    }
  }
  return true;
}

bool PatternInputGate::matches(const InjectionPattern& p,
                               const string& input) const {
  if (!p.perLine) {
    return RegexUtils::searchWindowed(RegexUtils::collapseWhitespace(input),
                                      p.pattern);
  }
  for (const auto& line : split(input, '\n')) {
    string l = RegexUtils::collapseWhitespace(line);
    if (!l.empty() && l.back() == '\r') {
      l.pop_back();
    }
    if (RegexUtils::searchWindowed(l, p.pattern)) {
      return true;
    }
  }
  return false;
}

InputDecision PatternInputGate::analyze(const string& input) {
  InputDecision decision{true, {}};
  for (const auto& p : patterns) {
    if (!matches(p, input)) {
      continue;
    }
    bool blocking = p.severity == InjectionSeverity::CRITICAL ||
                    p.severity == InjectionSeverity::HIGH ||
                    (strict && p.severity == InjectionSeverity::MEDIUM);
    if (blocking) {
      decision.allowed = false;
    }
    if (std::find(decision.categories.begin(), decision.categories.end(),
                  p.category) == decision.categories.end()) {
      decision.categories.push_back(p.category);
    }
  }
  if (!decision.categories.empty()) {
    VLOG(1) << "Input matched " << decision.categories.size()
            << " injection categories, "
            << (decision.allowed ? "allowing" : "blocking");
  }
  return decision;
}
}  // namespace pd
