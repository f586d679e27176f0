#ifndef __PD_REGEX_UTILS__
#define __PD_REGEX_UTILS__

#include <regex>

#include "Headers.hpp"

namespace pd {
/**
 * @brief std::regex helpers for scanning untrusted text.
 *
 * The libstdc++ matcher recurses once per consumed character, so a long
 * input can exhaust the thread's stack. Callers collapse whitespace runs and
 * search in bounded, overlapping windows instead of the whole string.
 */
class RegexUtils {
 public:
  static constexpr size_t WINDOW_SIZE = 2048;
  static constexpr size_t WINDOW_OVERLAP = 256;

  /**
   * @brief Replaces every run of whitespace with its first character.
   * Patterns written with `\s*` and `\s+` match the result exactly as they
   * match the original.
   */
  static string collapseWhitespace(const string& s);

  /**
   * @brief regex_search over windows of at most WINDOW_SIZE bytes that
   * overlap by WINDOW_OVERLAP. Windows after the first keep the previous
   * character visible, so `^` and `\b` behave as on the whole string.
   * A match longer than WINDOW_OVERLAP can be missed at a window edge.
   *
   * @param match receives the first match; it points into `text`.
   */
  static bool searchWindowed(const string& text, const std::regex& re,
                             std::smatch* match = NULL);
};
}  // namespace pd

#endif  // __PD_REGEX_UTILS__
