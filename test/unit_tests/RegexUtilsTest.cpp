#include "RegexUtils.hpp"

#include "TestHeaders.hpp"

using namespace pd;

TEST_CASE("RegexUtils collapses whitespace runs", "[RegexUtils]") {
  REQUIRE(RegexUtils::collapseWhitespace("") == "");
  REQUIRE(RegexUtils::collapseWhitespace("a  b\t\t c") == "a b\tc");
  REQUIRE(RegexUtils::collapseWhitespace("\r\n\r\nx ") == "\rx ");
  REQUIRE(RegexUtils::collapseWhitespace(string(100000, ' ') + "SYSTEM:") ==
          " SYSTEM:");
}

TEST_CASE("RegexUtils searches long text in windows", "[RegexUtils]") {
  std::regex word("needle\\s+([0-9]+)");

  SECTION("Short text") {
    std::smatch match;
    REQUIRE(RegexUtils::searchWindowed("a needle 42 here", word, &match));
    REQUIRE(match[1].str() == "42");
    REQUIRE_FALSE(RegexUtils::searchWindowed("no match", word));
  }

  SECTION("Match across a window edge") {
    string text(RegexUtils::WINDOW_SIZE - 4, 'x');
    text += " needle 7 ";
    text += string(1024 * 1024, 'y');
    std::smatch match;
    REQUIRE(RegexUtils::searchWindowed(text, word, &match));
    REQUIRE(match[1].str() == "7");
    REQUIRE(size_t(match[0].first - text.cbegin()) ==
            RegexUtils::WINDOW_SIZE - 3);
  }

  SECTION("Match near the end of a megabyte") {
    string text(1024 * 1024, 'z');
    text += "needle 99";
    std::smatch match;
    REQUIRE(RegexUtils::searchWindowed(text, word, &match));
    REQUIRE(match[1].str() == "99");
  }

  SECTION("Later windows do not see a line start") {
    std::regex anchored("^abc");
    string text(RegexUtils::WINDOW_SIZE * 3, 'q');
    text += "abc";
    REQUIRE_FALSE(RegexUtils::searchWindowed(text, anchored));
    REQUIRE(RegexUtils::searchWindowed("abc" + text, anchored));
  }
}
