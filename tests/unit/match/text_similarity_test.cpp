#include <autotag/match/text_similarity.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>

namespace am = autotag::match;

TEST(TextSimilarity, VerbatimKeywordScoresExact) {
  EXPECT_DOUBLE_EQ(am::keyword_confidence("Invoice Number: 12345", "invoice number"), 0.9);
  EXPECT_EQ(am::keyword_match_type("Invoice Number: 12345", "invoice number", 0.9), "exact");
}

TEST(TextSimilarity, NoKeywordWordScoresZero) {
  EXPECT_DOUBLE_EQ(am::keyword_confidence("hello world", "invoice"), 0.0);
  EXPECT_DOUBLE_EQ(am::keyword_confidence("", "invoice"), 0.0);
}

TEST(TextSimilarity, ShortKeywordWordsAreIgnored) {
  EXPECT_DOUBLE_EQ(am::keyword_confidence("hello there", "of"), 0.0);
  EXPECT_DOUBLE_EQ(am::keyword_confidence("out of time", "of"), 0.9);
}

TEST(TextSimilarity, PartialCoverageBlendsScores) {
  const double c = am::keyword_confidence("total invoice amount", "invoice number");
  EXPECT_NEAR(c, 0.6 * 0.5 + 0.4 * 1.0, 1e-12);
  EXPECT_EQ(am::keyword_match_type("total invoice amount", "invoice number", c), "partial");
}

TEST(TextSimilarity, WordHitsAreCapped) {
  // Every word present but not adjacent: coverage 1, average 1, capped at 0.8.
  EXPECT_DOUBLE_EQ(am::keyword_confidence("number of the invoice", "invoice number"),
                   am::kWordMatchCeiling);
}

TEST(TextSimilarity, WordSimilarity) {
  EXPECT_DOUBLE_EQ(am::word_similarity("same", "same"), 1.0);
  EXPECT_NEAR(am::word_similarity("invoice", "invoise"), 6.0 / 7.0, 1e-12);
  EXPECT_DOUBLE_EQ(am::word_similarity("ab", "abcdefgh"), 0.0);
}

TEST(TextSimilarity, ContainmentRatio) {
  EXPECT_DOUBLE_EQ(am::containment_ratio("Invoice", "invoice number"), 0.5);
  EXPECT_DOUBLE_EQ(am::containment_ratio("invoice number", "INVOICE"), 0.5);
  EXPECT_DOUBLE_EQ(am::containment_ratio("total", "invoice"), 0.0);
  EXPECT_DOUBLE_EQ(am::containment_ratio("", "invoice"), 0.0);
}

TEST(TextSimilarity, FindCaseInsensitive) {
  EXPECT_EQ(am::find_case_insensitive("The Quick Fox", "quick"), 4u);
  EXPECT_FALSE(am::find_case_insensitive("abc", "").has_value());
  EXPECT_FALSE(am::find_case_insensitive("abc", "abcd").has_value());
}

TEST(TextSimilarity, NormalizeAndSplit) {
  EXPECT_EQ(am::normalize_whitespace("  a \n\t b  c "), "a b c");
  const auto words = am::split_words(" one  two\nthree ");
  ASSERT_EQ(words.size(), 3u);
  EXPECT_EQ(words[2], "three");
  EXPECT_EQ(am::to_lower("MiXeD 123"), "mixed 123");
}

TEST(TextSimilarity, SnippetIsClampedToText) {
  const std::string text = "0123456789";
  EXPECT_EQ(am::make_snippet(text, 4, 2, 1), "3456");
  EXPECT_EQ(am::make_snippet(text, 0, 3, 50), text);
  EXPECT_EQ(am::make_snippet(text, 11, 1), "");
}

TEST(TextSimilarity, SnippetKeepsMultiByteCharactersWhole) {
  const std::string text = "\xC3\xBC" + std::string(48, 'a') + " Invoice Number: 12345";
  const auto offset = am::find_case_insensitive(text, "Invoice Number");
  ASSERT_TRUE(offset.has_value());
  const std::string head = am::make_snippet(text, *offset, 14);
  EXPECT_EQ(head.substr(0, 2), "\xC3\xBC");
  EXPECT_NO_THROW((void)nlohmann::json(head).dump());

  const std::string tail = am::make_snippet("ab\xC3\xA9" "cd", 0, 1, 2);
  EXPECT_EQ(tail, "ab\xC3\xA9");
  EXPECT_NO_THROW((void)nlohmann::json(tail).dump());
}
