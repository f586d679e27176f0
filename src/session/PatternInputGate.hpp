#ifndef __PD_PATTERN_INPUT_GATE__
#define __PD_PATTERN_INPUT_GATE__

#include <regex>

#include "Headers.hpp"
#include "RegexUtils.hpp"
#include "SecurityGates.hpp"

namespace pd {
enum class InjectionSeverity { LOW, MEDIUM, HIGH, CRITICAL };

struct InjectionPattern {
  string category;
  InjectionSeverity severity;
  std::regex pattern;
  /** @brief Match against each line on its own (for "^SYSTEM:" style
   * prefixes). */
  bool perLine;
};

/**
 * @brief Prompt-injection filter built from an ordered list of categorized
 * regular expressions.
 *
 * High and critical matches block the input; medium ones block only in
 * strict mode.
 */
class PatternInputGate : public InputGate {
 public:
  explicit PatternInputGate(bool _strict = false);
  PatternInputGate(const vector<InjectionPattern>& _patterns,
                   const vector<std::regex>& _quickPatterns, bool _strict);

  virtual bool quickCheck(const string& input);
  virtual InputDecision analyze(const string& input);

  static vector<InjectionPattern> defaultPatterns();
  static vector<std::regex> defaultQuickPatterns();

 protected:
  bool matches(const InjectionPattern& p, const string& input) const;

  vector<InjectionPattern> patterns;
  vector<std::regex> quickPatterns;
  bool strict;
};
}  // namespace pd

#endif  // __PD_PATTERN_INPUT_GATE__
