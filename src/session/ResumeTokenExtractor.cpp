#include "ResumeTokenExtractor.hpp"

namespace pd {
namespace {
// Session ids are uuids in practice; anything shorter than 8 characters is
// far more likely to be prose than an id.
const char* TOKEN = "([A-Za-z0-9][A-Za-z0-9_-]{7,127})";
}  // namespace

ResumeTokenExtractor::ResumeTokenExtractor() : rules(defaultRules()) {}

ResumeTokenExtractor::ResumeTokenExtractor(
    const vector<ResumeTokenRule>& _rules)
    : rules(_rules) {}

vector<ResumeTokenRule> ResumeTokenExtractor::defaultRules() {
  auto flags = std::regex::ECMAScript | std::regex::icase;
  return {
      {"resume-command",
       std::regex(string("[A-Za-z0-9_./-]{1,64}\\s+--resume\\s+") + TOKEN,
                  flags)},
      {"session-id", std::regex(string("session[ _-]?id\\s*[:=]\\s*") + TOKEN,
                                flags)},
      {"resuming", std::regex(string("\\bresuming\\s+(?:session\\s+)?") + TOKEN,
                              flags)},
  };
}

string ResumeTokenExtractor::stripAnsi(const string& s) {
  string out;
  out.reserve(s.size());
  size_t i = 0;
  while (i < s.size()) {
    char c = s[i];
    if (c == '\x1b' && i + 1 < s.size()) {
      char next = s[i + 1];
      if (next == '[') {
        // CSI: parameters and intermediates, then one final byte
        i += 2;
        while (i < s.size() && !(s[i] >= '@' && s[i] <= '~')) {
          i++;
        }
        i++;
        continue;
      }
      if (next == ']') {
        // OSC: terminated by BEL or ST
        i += 2;
        while (i < s.size()) {
          if (s[i] == '\x07') {
            i++;
            break;
          }
          if (s[i] == '\x1b' && i + 1 < s.size() && s[i + 1] == '\\') {
            i += 2;
            break;
          }
          i++;
        }
        continue;
      }
      i += 2;
      continue;
    }
    if (c != '\r') {
      out.push_back(c);
    }
    i++;
  }
  return out;
}

optional<string> ResumeTokenExtractor::extract(const string& chunk) const {
  string text = RegexUtils::collapseWhitespace(stripAnsi(chunk));
  for (const auto& rule : rules) {
    std::smatch match;
    if (RegexUtils::searchWindowed(text, rule.pattern, &match) &&
        match.size() > 1) {
      VLOG(1) << "Resume token matched rule " << rule.name;
      return match[1].str();
    }
  }
  return nullopt;
}
}  // namespace pd
