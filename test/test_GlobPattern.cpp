#include "gmatch/GlobPattern.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

using namespace gmatch;

namespace {

void expectMatch(std::string_view pattern, std::string_view str) {
  auto glob = GlobPattern::parse(pattern);
  ASSERT_TRUE(glob.has_value()) << glob.error().message();
  EXPECT_TRUE(glob->matches_partially(str)) << "\"" << pattern << "\" should match \"" << str << "\"";

  auto oneShot = matches_partially(pattern, str);
  ASSERT_TRUE(oneShot.has_value());
  EXPECT_TRUE(*oneShot);
}

void expectNoMatch(std::string_view pattern, std::string_view str) {
  auto glob = GlobPattern::parse(pattern);
  ASSERT_TRUE(glob.has_value()) << glob.error().message();
  EXPECT_FALSE(glob->matches_partially(str)) << "\"" << pattern << "\" should not match \"" << str << "\"";

  auto oneShot = matches_partially(pattern, str);
  ASSERT_TRUE(oneShot.has_value());
  EXPECT_FALSE(*oneShot);
}

} // namespace

TEST(GlobPattern, LiteralOnly) {
  expectMatch("bc", "abcd");
  expectMatch("abcd", "abcd");
  expectMatch("ab", "abc");
  expectMatch("bc", "bc");
  expectNoMatch("abc", "ab");
}

TEST(GlobPattern, EmptyPattern) {
  expectMatch("", "");
  expectMatch("", "abc");
}

TEST(GlobPattern, AsteriskOnly) {
  expectMatch("*", "");
  expectMatch("*", "42");
}

TEST(GlobPattern, QuestionMarkOnly) {
  expectNoMatch("?", "");
  expectMatch("?", "?");
  expectMatch("?", "???...");
}

TEST(GlobPattern, AsteriskThenLiteral) {
  expectNoMatch("*\\*", "");
  expectNoMatch("*abc", "ab");
  expectMatch("*foo", "foo");
  expectMatch("*you", "Do you think so?");
  expectNoMatch("*you", "I don't think so.");
  expectMatch("*otherwise\\?", "Why do you think otherwise?");
}

TEST(GlobPattern, QuestionMarkThenLiteral) {
  expectNoMatch("?a", "");
  expectNoMatch("?a", "a");
  expectMatch("?bc", "abcd");
  expectMatch("?bc", "abc");
  expectMatch("?cde", "abcdef");
  expectMatch("?f", "abcdef");
  expectNoMatch("?AR", "foobarbaz");
}

TEST(GlobPattern, LiteralThenAsterisk) {
  expectNoMatch("Letter.*", "");
  expectNoMatch("letter*", "let");
  expectMatch("foo*", "foo");
  expectMatch("you*", "Do you think so?");
  expectNoMatch("you*", "I don't think so.");
  expectMatch("otherwise\\?*", "Why do you think otherwise?");
}

TEST(GlobPattern, LiteralThenQuestionMark) {
  expectNoMatch("a?", "");
  expectNoMatch("a?", "a");
  expectMatch("ab?", "abcd");
  expectMatch("ab?", "abc");
  expectMatch("cd?", "abcdef");
  expectMatch("de?", "abcdef");
  expectNoMatch("AR?", "foobarbaz");
}

TEST(GlobPattern, QuestionMarkAndAsterisk) {
  expectNoMatch("?*", "");
  expectNoMatch("*?", "");
  expectMatch("*?", "a");
  expectMatch("?*", "a");
  expectMatch("*?", "01");
  expectMatch("?*", "10");
  expectMatch("?*", "Hello, World!");
  expectMatch("*?", "foo");
}

TEST(GlobPattern, WildcardsOnlyOnEmptyString) {
  expectMatch("**", "");
  expectMatch("****", "");
  expectNoMatch("??", "");
  expectNoMatch("?**", "");
  expectNoMatch("*?*", "");
  expectNoMatch("**?", "");
}

TEST(GlobPattern, WildcardsOnlyOnSingleCharacter) {
  expectMatch("**", "a");
  expectMatch("****", "a");
  expectNoMatch("??", "0");
  expectMatch("?**", "1");
  expectMatch("*?*", "2");
  expectMatch("**?", "3");
  expectNoMatch("??", " ");
}

TEST(GlobPattern, WildcardLiteralWildcard) {
  expectNoMatch("*-*", "");
  expectMatch("*de*", "de");
  expectMatch("*de*", "abdefg");
  expectNoMatch("*de*", "abdfg");
}

TEST(GlobPattern, FileNamePatterns) {
  expectMatch("*.json", "folder/foo.json");
  expectNoMatch("*.yaml", "path/to/foo.json");
  expectMatch("path/to/*.yaml", "path/to/foo.yaml");
  expectMatch("thesis-*.pdf", "My Documents/thesis/thesis-final-2.pdf");
}

TEST(GlobPattern, BracketsAreLiterals) {
  expectNoMatch("[*,*,*]", "[1, 2]");
  expectMatch("[*,*,*]", "[1, 2, 3]");
  expectMatch("[*,*,*]", "{\"key\": [1, 2, 3]}");
  expectNoMatch("[*,*,*]", "foo/bar.yaml");
}

TEST(GlobPattern, EscapedCharactersMatchThemselves) {
  expectMatch("\\*", "My favourite character is '*'.");
  expectNoMatch("\\*", "My favourite character is '#'.");
  expectMatch("\\\\", "Windows path separator: \\");
  expectNoMatch("\\\\", "Linux/Unix path separator: /");
  expectMatch("a\\?b", "xa?by");
  expectNoMatch("a\\?b", "xacby");
}

TEST(GlobPattern, EmptyCandidateMatchesOnlyZeroLengthPatterns) {
  for (std::string_view pattern : {"", "*", "**", "***"}) {
    expectMatch(pattern, "");
  }
  for (std::string_view pattern : {"?", "a", "*a", "a*", "*?*", "\\*", "*\\\\*"}) {
    expectNoMatch(pattern, "");
  }
}

TEST(GlobPattern, ParseErrorsArePropagated) {
  auto glob = GlobPattern::parse("\\n");
  ASSERT_FALSE(glob.has_value());
  EXPECT_EQ(glob.error().kind(), ParseError::Kind::UnknownEscapeSequence);
  EXPECT_EQ(glob.error().position(), 0);
  EXPECT_EQ(glob.error().text(), "\\n");
  EXPECT_EQ(glob.error().message(), "unknown escape sequence '\\n' at position 0");

  auto oneShot = matches_partially("abc\\", "abc\\");
  ASSERT_FALSE(oneShot.has_value());
  EXPECT_EQ(oneShot.error(), ParseError::unterminated_escape_sequence(3));
  EXPECT_EQ(oneShot.error().message(), "unterminated escape sequence at position 3");
  EXPECT_TRUE(oneShot.error().text().empty());
}

TEST(GlobPattern, TokensAndMinMatchLength) {
  auto glob = parse("?*?**?");
  ASSERT_TRUE(glob.has_value());
  ASSERT_EQ(glob->tokens().size(), 1);
  auto const* wildcard = glob->tokens()[0].getIf<MinLengthWildcard>();
  ASSERT_NE(wildcard, nullptr);
  EXPECT_EQ(wildcard->min_length_, 3);
  EXPECT_EQ(glob->min_match_length(), 3);

  auto mixed = parse("a?b*c\\*");
  ASSERT_TRUE(mixed.has_value());
  EXPECT_EQ(mixed->min_match_length(), 5);
  EXPECT_EQ(mixed->source(), "a?b*c\\*");
}

TEST(GlobPattern, OutlivesPatternBuffer) {
  auto glob = [] {
    std::string pattern = "needle*haystack";
    auto        parsed  = GlobPattern::parse(pattern);
    pattern.assign(pattern.size(), 'x');
    return parsed;
  }();
  ASSERT_TRUE(glob.has_value());
  EXPECT_TRUE(glob->matches_partially("a needle in a haystack"));
  EXPECT_FALSE(glob->matches_partially("xxxxxxxxxxxxxxx"));
}

TEST(GlobPattern, CopiesShareTheSameTokens) {
  auto glob = GlobPattern::parse("ab\\?cd");
  ASSERT_TRUE(glob.has_value());
  GlobPattern copy  = *glob;
  GlobPattern moved = std::move(*glob);
  EXPECT_TRUE(copy.matches_partially("xab?cdx"));
  EXPECT_TRUE(moved.matches_partially("xab?cdx"));
  EXPECT_EQ(copy.source().data(), moved.source().data());
}

TEST(GlobPattern, ConcurrentReadOnlyMatching) {
  auto glob = GlobPattern::parse("*-page-*.txt");
  ASSERT_TRUE(glob.has_value());

  std::vector<int>         results(8, 0);
  std::vector<std::thread> workers;
  for (size_t i = 0; i < results.size(); ++i) {
    workers.emplace_back([&glob, &results, i] {
      for (int n = 0; n < 1000; ++n) {
        if (glob->matches_partially("doc-page-" + std::to_string(n) + ".txt")) {
          ++results[i];
        }
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }
  EXPECT_TRUE(std::ranges::all_of(results, [](int count) { return count == 1000; }));
}
