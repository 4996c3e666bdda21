#pragma once

#include <autotag/core/candidate.hpp>
#include <autotag/core/matcher.hpp>
#include <cstddef>
#include <span>
#include <string>

namespace autotag::match {

inline constexpr double kSegmentTextConfidence = 0.95;
inline constexpr double kSegmentKeywordConfidence = 0.9;

/// Summary statistics of a word-timed transcript.
struct TranscriptStats {
  double duration{0.0};  // end time of the last word, seconds
  std::size_t word_count{0};
  std::size_t unique_words{0};  // case-insensitive
  double speech_rate{0.0};      // words per minute
  double vocabulary_diversity{0.0};
  double average_word_duration{0.0};
};

/// Words joined with single spaces.
[[nodiscard]] std::string join_transcript(std::span<const autotag::core::TranscriptWord> words);

[[nodiscard]] TranscriptStats transcript_stats(std::span<const autotag::core::TranscriptWord> words);

/// Finds stored audio segment texts (or their keywords) in the candidate transcript.
///
/// Reported start/end times are those stored with the pattern, not positions in the
/// candidate recording.
class AudioSegmentMatcher : public autotag::core::IModalityMatcher {
 public:
  [[nodiscard]] autotag::core::FileType file_type() const noexcept override {
    return autotag::core::FileType::Audio;
  }

  [[nodiscard]] std::expected<autotag::core::MatchOutput, autotag::core::EngineError> match(
      const autotag::core::CandidateContent& content,
      const autotag::core::MatchContext& context) const override;
};

}  // namespace autotag::match
