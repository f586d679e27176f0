#ifndef __PD_RESUME_TOKEN_EXTRACTOR__
#define __PD_RESUME_TOKEN_EXTRACTOR__

#include <regex>

#include "Headers.hpp"
#include "RegexUtils.hpp"

namespace pd {
/**
 * @brief One heuristic for spotting the wrapped CLI's own session id in its
 * output. The first capture group is the token.
 */
struct ResumeTokenRule {
  string name;
  std::regex pattern;
};

/**
 * @brief Scrapes resumption hints out of human-readable terminal output.
 *
 * The wrapped CLI has no stable output schema, so this is best effort:
 * rules are tried in order, the first hit wins, and a miss is never an
 * error.
 */
class ResumeTokenExtractor {
 public:
  /** @brief Uses `defaultRules()`. */
  ResumeTokenExtractor();
  explicit ResumeTokenExtractor(const vector<ResumeTokenRule>& _rules);
  virtual ~ResumeTokenExtractor() {}

  /** @brief Returns the token found by the first matching rule. */
  virtual optional<string> extract(const string& chunk) const;

  /**
   * @brief `<tool> --resume <token>`, `session id: <token>`,
   * `Resuming <token>`.
   */
  static vector<ResumeTokenRule> defaultRules();

  /** @brief Removes CSI/OSC escape sequences and carriage returns. */
  static string stripAnsi(const string& s);

 protected:
  vector<ResumeTokenRule> rules;
};
}  // namespace pd

#endif  // __PD_RESUME_TOKEN_EXTRACTOR__
