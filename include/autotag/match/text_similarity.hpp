#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace autotag::match {

/// Confidence of a verbatim (case-insensitive) keyword hit.
inline constexpr double kExactKeywordConfidence = 0.9;
/// Upper bound for keyword confidence built from individual word hits.
inline constexpr double kWordMatchCeiling = 0.8;

/// ASCII lower-casing; other bytes pass through unchanged.
[[nodiscard]] std::string to_lower(std::string_view text);

/// Splits on runs of whitespace; no empty words.
[[nodiscard]] std::vector<std::string> split_words(std::string_view text);

/// Collapses whitespace runs to one space and trims both ends.
[[nodiscard]] std::string normalize_whitespace(std::string_view text);

/// Offset of the first case-insensitive occurrence of needle. An empty needle never matches.
[[nodiscard]] std::optional<std::size_t> find_case_insensitive(std::string_view haystack,
                                                               std::string_view needle);

[[nodiscard]] bool contains_case_insensitive(std::string_view haystack, std::string_view needle);

/// Positional character similarity: 0 when the lengths differ by more than half the longer
/// word, else equal characters at equal offsets divided by the longer length.
[[nodiscard]] double word_similarity(std::string_view a, std::string_view b) noexcept;

/// Length ratio min/max when one string contains the other (case-insensitive), else 0.
/// Returns 0 when either string is empty.
[[nodiscard]] double containment_ratio(std::string_view a, std::string_view b);

/// Scores how well keyword appears in text, in [0, 0.9]:
/// 0.9 for a verbatim case-insensitive substring, otherwise a blend of word coverage and
/// per-word scores capped at 0.8, or 0 when no keyword word (longer than 2 chars) is found.
[[nodiscard]] double keyword_confidence(std::string_view text, std::string_view keyword);

/// "exact" for a verbatim substring, "partial" above 0.3 confidence, else "keyword".
[[nodiscard]] std::string_view keyword_match_type(std::string_view text,
                                                  std::string_view keyword,
                                                  double confidence);

/// Fragment of text around [offset, offset+length) with up to radius characters each side.
[[nodiscard]] std::string make_snippet(std::string_view text,
                                       std::size_t offset,
                                       std::size_t length,
                                       std::size_t radius = 50);

}  // namespace autotag::match
