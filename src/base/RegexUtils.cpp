#include "RegexUtils.hpp"

namespace pd {
string RegexUtils::collapseWhitespace(const string& s) {
  string out;
  out.reserve(s.size());
  bool inRun = false;
  for (char c : s) {
    if (::isspace((unsigned char)c)) {
      if (!inRun) {
        out.push_back(c);
      }
      inRun = true;
    } else {
      out.push_back(c);
      inRun = false;
    }
  }
  return out;
}

bool RegexUtils::searchWindowed(const string& text, const std::regex& re,
                                std::smatch* match) {
  std::smatch local;
  std::smatch& m = match ? *match : local;
  size_t start = 0;
  while (true) {
    size_t end = min(text.size(), start + WINDOW_SIZE);
    std::regex_constants::match_flag_type flags =
        std::regex_constants::match_default;
    if (start > 0) {
      flags |= std::regex_constants::match_prev_avail;
    }
    if (std::regex_search(text.cbegin() + start, text.cbegin() + end, m, re,
                          flags)) {
      return true;
    }
    if (end == text.size()) {
      return false;
    }
    start = end - WINDOW_OVERLAP;
  }
}
}  // namespace pd
