#pragma once

#include <autotag/core/candidate.hpp>
#include <autotag/core/matcher.hpp>
#include <autotag/vision/image_features.hpp>
#include <autotag/vision/region_detector.hpp>
#include <memory>
#include <string>
#include <vector>

namespace autotag::match {

inline constexpr double kTextRegionConfidence = 0.8;
/// Upper bound for confidences propagated from similar reference images.
inline constexpr double kSimilarImageCeiling = 0.9;

/// Matches stored image annotations against the candidate image.
///
/// Text boxes ("image" patterns) are correlated with the candidate's OCR detections;
/// "visual" patterns have their region cropped from the candidate and analysed, with the
/// region detector when one is set. Each annotation id is processed once, and only the
/// first visual match per pattern label is kept. When the candidate produced visual
/// matches, the visual matches of sufficiently similar reference images are propagated.
/// Text matches are reported before visual ones.
class ImageRegionMatcher : public autotag::core::IModalityMatcher {
 public:
  explicit ImageRegionMatcher(
      std::shared_ptr<autotag::vision::IRegionDetector> detector = nullptr,
      double similar_image_threshold = autotag::vision::kDefaultSimilarityThreshold)
      : detector_(std::move(detector)), similar_image_threshold_(similar_image_threshold) {}

  [[nodiscard]] autotag::core::FileType file_type() const noexcept override {
    return autotag::core::FileType::Image;
  }

  [[nodiscard]] std::expected<autotag::core::MatchOutput, autotag::core::EngineError> match(
      const autotag::core::CandidateContent& content,
      const autotag::core::MatchContext& context) const override;

  [[nodiscard]] bool has_detector() const noexcept { return detector_ != nullptr; }

 private:
  /// Appends matches propagated from similar reference images; returns how many were added.
  std::size_t propagate_similar(const autotag::core::ImageContent& image,
                                std::vector<autotag::core::MatchCandidate>& visual) const;

  std::shared_ptr<autotag::vision::IRegionDetector> detector_;
  double similar_image_threshold_;
};

}  // namespace autotag::match
