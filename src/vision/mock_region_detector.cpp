#include <autotag/vision/mock_region_detector.hpp>
#include <autotag/core/error.hpp>
#include <autotag/core/image.hpp>

namespace autotag::vision {

void MockRegionDetector::set_detection(RegionDetection detection) {
  std::lock_guard lock(mutex_);
  detection_ = std::move(detection);
}

void MockRegionDetector::set_failure(std::optional<autotag::core::EngineError> error) {
  std::lock_guard lock(mutex_);
  failure_ = error;
}

std::expected<RegionDetection, autotag::core::EngineError> MockRegionDetector::detect(
    const autotag::core::Image& region) {
  ++calls_;
  if (region.empty()) {
    return std::unexpected(autotag::core::EngineError::InvalidImage);
  }
  std::lock_guard lock(mutex_);
  if (failure_) {
    return std::unexpected(*failure_);
  }
  return detection_;
}

}  // namespace autotag::vision
