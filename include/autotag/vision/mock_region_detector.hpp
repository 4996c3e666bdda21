#pragma once

#include <autotag/vision/region_detector.hpp>
#include <atomic>
#include <cstddef>
#include <mutex>
#include <optional>

namespace autotag::vision {

/// Detector returning a configurable detection (or failure) for every region (tests/demo).
class MockRegionDetector : public IRegionDetector {
 public:
  /// Detection returned by subsequent detect() calls.
  void set_detection(RegionDetection detection);

  /// Makes subsequent detect() calls fail with the given error; nullopt clears it.
  void set_failure(std::optional<autotag::core::EngineError> error);

  [[nodiscard]] std::expected<RegionDetection, autotag::core::EngineError> detect(
      const autotag::core::Image& region) override;

  /// Number of detect() calls so far.
  [[nodiscard]] std::size_t calls() const noexcept { return calls_.load(); }

 private:
  mutable std::mutex mutex_;
  RegionDetection detection_;
  std::optional<autotag::core::EngineError> failure_;
  std::atomic<std::size_t> calls_{0};
};

}  // namespace autotag::vision
