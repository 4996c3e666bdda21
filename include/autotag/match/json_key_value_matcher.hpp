#pragma once

#include <autotag/core/matcher.hpp>

namespace autotag::match {

/// Tier confidences, highest priority first.
inline constexpr double kExactKeyConfidence = 0.95;
inline constexpr double kExactValueConfidence = 0.9;
inline constexpr double kPartialKeyConfidence = 0.8;
inline constexpr double kPartialValueConfidence = 0.7;

/// Matches stored JSON key/value patterns against the candidate's flattened pairs.
///
/// Each pattern is tried tier by tier: exact key, exact value, partial key, partial value
/// (all case-insensitive). The first tier satisfied by any pair decides the confidence, and
/// the first qualifying pair of that tier is reported. One candidate per pattern at most.
class JsonKeyValueMatcher : public autotag::core::IModalityMatcher {
 public:
  [[nodiscard]] autotag::core::FileType file_type() const noexcept override {
    return autotag::core::FileType::Json;
  }

  [[nodiscard]] std::expected<autotag::core::MatchOutput, autotag::core::EngineError> match(
      const autotag::core::CandidateContent& content,
      const autotag::core::MatchContext& context) const override;
};

}  // namespace autotag::match
