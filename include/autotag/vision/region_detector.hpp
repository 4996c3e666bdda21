#pragma once

#include <autotag/core/candidate.hpp>
#include <autotag/core/error.hpp>
#include <autotag/core/image.hpp>
#include <expected>
#include <vector>

namespace autotag::vision {

/// Objects and logos found in one image region, each list sorted by score (descending).
struct RegionDetection {
  std::vector<autotag::core::DetectedObject> objects;
  std::vector<autotag::core::DetectedObject> logos;
  /// Pixel fraction of each dominant colour in the region (optional, detector specific).
  std::vector<double> dominant_color_scores;
};

/// Abstract object/logo detector run on cropped regions of a candidate image.
/// Implementations must be safe to call from several scan workers at once.
class IRegionDetector {
 public:
  virtual ~IRegionDetector() = default;

  /// Errors: InvalidImage for an empty region; ExtractionFailed when the model fails.
  [[nodiscard]] virtual std::expected<RegionDetection, autotag::core::EngineError> detect(
      const autotag::core::Image& region) = 0;

  /// Optional: dummy run after construction. Default: no-op.
  virtual void warmup() {}
};

}  // namespace autotag::vision
