#include "utils/aho_corasick.hpp"
#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <tuple>
#include <vector>

using Utils::AhoCorasick;
using Utils::MatchSpan;
using Utils::ScanMode;

namespace {

using Span = std::tuple<size_t, size_t, std::u32string>;

std::vector<Span> to_tuples(const std::vector<MatchSpan> &spans) {
  std::vector<Span> out;
  for (const auto &span : spans)
    out.emplace_back(span.start, span.end, std::u32string(span.word));
  return out;
}

} // namespace

TEST(AhoCorasickTest, ClassicUshersExample) {
  AhoCorasick matcher({U"he", U"she", U"his", U"hers"});
  EXPECT_EQ(matcher.pattern_count(), 4u);

  auto spans = to_tuples(matcher.find_all(U"ushers"));
  std::vector<Span> expected = {
      {1, 4, U"she"}, {2, 4, U"he"}, {2, 6, U"hers"}};
  EXPECT_EQ(spans, expected);
  EXPECT_TRUE(matcher.contains_any(U"ushers"));
}

TEST(AhoCorasickTest, OverlappingAndNestedMatches) {
  AhoCorasick matcher({U"ab", U"abc", U"bcd", U"c"});

  auto spans = to_tuples(matcher.find_all(U"abcd"));
  std::vector<Span> expected = {
      {0, 2, U"ab"}, {0, 3, U"abc"}, {2, 3, U"c"}, {1, 4, U"bcd"}};
  EXPECT_EQ(spans, expected);
}

TEST(AhoCorasickTest, SpansAreOrderedByEndThenLongestFirst) {
  AhoCorasick matcher({U"a", U"aa", U"aaa"});
  auto spans = to_tuples(matcher.find_all(U"aaa"));
  std::vector<Span> expected = {{0, 1, U"a"},  {0, 2, U"aa"}, {1, 2, U"a"},
                                {0, 3, U"aaa"}, {1, 3, U"aa"}, {2, 3, U"a"}};
  EXPECT_EQ(spans, expected);
}

TEST(AhoCorasickTest, FollowsFailureLinksAfterPartialMatch) {
  AhoCorasick matcher({U"aab"});
  auto spans = to_tuples(matcher.find_all(U"aaab"));
  ASSERT_EQ(spans.size(), 1u);
  EXPECT_EQ(spans[0], Span(1, 4, U"aab"));

  EXPECT_FALSE(matcher.contains_any(U"aaaa"));
  EXPECT_FALSE(matcher.contains_any(U"aba"));
}

TEST(AhoCorasickTest, UnicodePatterns) {
  AhoCorasick matcher({U"жаба", U"日本", U"\U0001F600"});
  auto spans = to_tuples(matcher.find_all(U"это жаба в 日本 \U0001F600!"));
  std::vector<Span> expected = {
      {4, 8, U"жаба"}, {11, 13, U"日本"}, {14, 15, U"\U0001F600"}};
  EXPECT_EQ(spans, expected);
}

TEST(AhoCorasickTest, ExistenceModeStopsWithoutSpans) {
  AhoCorasick matcher({U"needle"});
  auto result = matcher.scan(U"haystack with a needle and another needle",
                             ScanMode::EXISTENCE);
  EXPECT_TRUE(result.found);
  EXPECT_TRUE(result.spans.empty());

  auto all = matcher.scan(U"haystack with a needle and another needle",
                          ScanMode::ALL_SPANS);
  EXPECT_TRUE(all.found);
  EXPECT_EQ(all.spans.size(), 2u);

  auto none = matcher.scan(U"just hay", ScanMode::ALL_SPANS);
  EXPECT_FALSE(none.found);
  EXPECT_TRUE(none.spans.empty());
}

TEST(AhoCorasickTest, EmptyAutomatonMatchesNothing) {
  AhoCorasick empty;
  EXPECT_TRUE(empty.empty());
  EXPECT_EQ(empty.node_count(), 1u);
  EXPECT_FALSE(empty.contains_any(U"anything"));
  EXPECT_TRUE(empty.find_all(U"anything").empty());

  AhoCorasick only_empty_patterns({U"", U""});
  EXPECT_TRUE(only_empty_patterns.empty());
  EXPECT_FALSE(only_empty_patterns.contains_any(U""));
}

TEST(AhoCorasickTest, EmptyTextMatchesNothing) {
  AhoCorasick matcher({U"a"});
  EXPECT_FALSE(matcher.contains_any(U""));
  EXPECT_TRUE(matcher.find_all(U"").empty());
}

TEST(AhoCorasickTest, DuplicatePatternsAreReportedOnce) {
  AhoCorasick matcher({U"dup", U"dup", U"du"});
  EXPECT_EQ(matcher.pattern_count(), 2u);
  EXPECT_EQ(matcher.pattern(0), U"dup");
  EXPECT_EQ(matcher.pattern(1), U"du");

  auto spans = to_tuples(matcher.find_all(U"dup"));
  std::vector<Span> expected = {{0, 2, U"du"}, {0, 3, U"dup"}};
  EXPECT_EQ(spans, expected);
}

TEST(AhoCorasickTest, MatchesAreCaseSensitiveOnCodePoints) {
  AhoCorasick matcher({U"word"});
  EXPECT_FALSE(matcher.contains_any(U"WORD"));
  EXPECT_TRUE(matcher.contains_any(U"sword"));
}

TEST(AhoCorasickTest, PhrasePatternsWithSpaces) {
  AhoCorasick matcher({U"bad word"});
  EXPECT_TRUE(matcher.contains_any(U"a bad word here"));
  EXPECT_FALSE(matcher.contains_any(U"a bad  word here"));
}

TEST(AhoCorasickTest, SharedPrefixesShareNodes) {
  AhoCorasick matcher({U"test", U"tester", U"testing"});
  // root + t,e,s,t + e,r + i,n,g
  EXPECT_EQ(matcher.node_count(), 1u + 4 + 2 + 3);
}
