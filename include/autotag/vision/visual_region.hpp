#pragma once

#include <autotag/core/geometry.hpp>
#include <autotag/core/image.hpp>
#include <autotag/vision/image_features.hpp>
#include <autotag/vision/region_detector.hpp>
#include <optional>
#include <string>

namespace autotag::vision {

/// Feature thresholds deciding whether a cropped region holds a meaningful visual element.
/// Any one of texture, edges or a dominant histogram bin suffices, given the minimum area.
struct VisualThresholds {
  double texture{0.0};
  double edges{0.0};
  double histogram_bin{0.0};
  double min_area{0.0};
  double confidence{0.0};
};

/// Used when a detector ran but found no object or logo.
inline constexpr VisualThresholds kDetectorThresholds{50.0, 20.0, 0.1, 500.0, 0.7};
/// Used when no detector is configured (or it failed).
inline constexpr VisualThresholds kFeatureOnlyThresholds{30.0, 15.0, 0.05, 300.0, 0.6};

/// Regions must be strictly larger than this in both dimensions after clipping.
inline constexpr std::uint32_t kMinRegionSide = 10;
inline constexpr double kDominantColorScore = 0.3;
inline constexpr double kDominantColorConfidence = 0.6;
inline constexpr double kFallbackMinArea = 1000.0;
inline constexpr double kFallbackConfidence = 0.4;

/// Description and confidence of a region judged meaningful.
struct VisualFinding {
  std::string description;
  double confidence{0.0};
};

[[nodiscard]] bool has_visual_content(const ImageFeatures& features,
                                      const VisualThresholds& thresholds) noexcept;

/// Crops box (rounded, clipped to the image) and decides whether it holds a meaningful
/// visual element. detector may be null. Regions not larger than 10x10 yield nullopt.
/// When cropping or feature extraction fails, boxes of at least 1000 px² still yield a
/// low-confidence "Visual Element (fallback)" finding.
[[nodiscard]] std::optional<VisualFinding> analyze_visual_region(
    const autotag::core::Image& image,
    const autotag::core::BoundingBox& box,
    IRegionDetector* detector);

}  // namespace autotag::vision
