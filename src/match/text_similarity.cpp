#include <autotag/match/text_similarity.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace autotag::match {

namespace {

constexpr std::size_t kMinKeywordWordLength = 3;  // shorter keyword words are ignored
constexpr std::size_t kMinFuzzyWordLength = 4;
constexpr double kFuzzyAcceptance = 0.7;
constexpr double kFuzzyScale = 0.8;
constexpr double kCoverageWeight = 0.6;
constexpr double kWordScoreWeight = 0.4;
constexpr double kPartialMatchConfidence = 0.3;

bool is_space(char c) noexcept {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

/// Best score of one keyword word against every word of the text.
double best_word_score(const std::string& keyword_word, const std::vector<std::string>& words) {
  double best = 0.0;
  for (const auto& word : words) {
    if (word == keyword_word) {
      return 1.0;
    }
    if (word.find(keyword_word) != std::string::npos ||
        keyword_word.find(word) != std::string::npos) {
      const double ratio = static_cast<double>(std::min(word.size(), keyword_word.size())) /
                           static_cast<double>(std::max(word.size(), keyword_word.size()));
      best = std::max(best, ratio);
    } else if (keyword_word.size() >= kMinFuzzyWordLength && word.size() >= kMinFuzzyWordLength) {
      const double similarity = word_similarity(keyword_word, word);
      if (similarity > kFuzzyAcceptance) {
        best = std::max(best, similarity * kFuzzyScale);
      }
    }
  }
  return best;
}

}  // namespace

std::string to_lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  return out;
}

std::vector<std::string> split_words(std::string_view text) {
  std::vector<std::string> words;
  std::size_t i = 0;
  while (i < text.size()) {
    while (i < text.size() && is_space(text[i])) ++i;
    const std::size_t start = i;
    while (i < text.size() && !is_space(text[i])) ++i;
    if (i > start) words.emplace_back(text.substr(start, i - start));
  }
  return words;
}

std::string normalize_whitespace(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  bool pending_space = false;
  for (char c : text) {
    if (is_space(c)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) out.push_back(' ');
    pending_space = false;
    out.push_back(c);
  }
  return out;
}

std::optional<std::size_t> find_case_insensitive(std::string_view haystack,
                                                 std::string_view needle) {
  if (needle.empty() || needle.size() > haystack.size()) return std::nullopt;
  const std::string h = to_lower(haystack);
  const std::string n = to_lower(needle);
  const auto pos = h.find(n);
  if (pos == std::string::npos) return std::nullopt;
  return pos;
}

bool contains_case_insensitive(std::string_view haystack, std::string_view needle) {
  return find_case_insensitive(haystack, needle).has_value();
}

double word_similarity(std::string_view a, std::string_view b) noexcept {
  if (a == b) return 1.0;
  const std::size_t longer = std::max(a.size(), b.size());
  const std::size_t shorter = std::min(a.size(), b.size());
  if (static_cast<double>(longer - shorter) > static_cast<double>(longer) * 0.5) {
    return 0.0;
  }
  std::size_t common = 0;
  for (std::size_t i = 0; i < shorter; ++i) {
    if (a[i] == b[i]) ++common;
  }
  return static_cast<double>(common) / static_cast<double>(longer);
}

double containment_ratio(std::string_view a, std::string_view b) {
  if (a.empty() || b.empty()) return 0.0;
  const std::string la = to_lower(a);
  const std::string lb = to_lower(b);
  if (la.find(lb) == std::string::npos && lb.find(la) == std::string::npos) return 0.0;
  return static_cast<double>(std::min(la.size(), lb.size())) /
         static_cast<double>(std::max(la.size(), lb.size()));
}

double keyword_confidence(std::string_view text, std::string_view keyword) {
  if (contains_case_insensitive(text, keyword)) {
    return kExactKeywordConfidence;
  }

  std::vector<std::string> keyword_words;
  for (auto& word : split_words(to_lower(keyword))) {
    if (word.size() >= kMinKeywordWordLength) keyword_words.push_back(std::move(word));
  }
  if (keyword_words.empty()) return 0.0;

  const std::vector<std::string> text_words = split_words(to_lower(text));
  std::size_t matched = 0;
  double score_sum = 0.0;
  for (const auto& kw : keyword_words) {
    const double best = best_word_score(kw, text_words);
    if (best > 0.0) {
      ++matched;
      score_sum += best;
    }
  }
  if (matched == 0) return 0.0;

  const double coverage = static_cast<double>(matched) / static_cast<double>(keyword_words.size());
  const double average = score_sum / static_cast<double>(matched);
  return std::min(kWordMatchCeiling, kCoverageWeight * coverage + kWordScoreWeight * average);
}

std::string_view keyword_match_type(std::string_view text,
                                    std::string_view keyword,
                                    double confidence) {
  if (contains_case_insensitive(text, keyword)) return "exact";
  if (confidence > kPartialMatchConfidence) return "partial";
  return "keyword";
}

std::string make_snippet(std::string_view text,
                         std::size_t offset,
                         std::size_t length,
                         std::size_t radius) {
  if (offset > text.size()) return {};
  // Window edges never split a UTF-8 sequence: start moves back, end moves forward.
  const auto is_continuation = [&](std::size_t i) {
    return (static_cast<unsigned char>(text[i]) & 0xC0) == 0x80;
  };
  std::size_t start = offset > radius ? offset - radius : 0;
  while (start > 0 && is_continuation(start)) --start;
  std::size_t end = std::min(text.size(), offset + length + radius);
  while (end < text.size() && is_continuation(end)) ++end;
  return std::string(text.substr(start, end - start));
}

}  // namespace autotag::match
