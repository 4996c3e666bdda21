#pragma once

#include <autotag/app/config.hpp>
#include <autotag/core/engine.hpp>
#include <autotag/vision/region_detector.hpp>
#include <memory>

namespace autotag::app {

/// Creates the region detector named by config (nullptr for RegionDetectorType::None).
/// Throws std::runtime_error when the detector cannot be created: missing model path,
/// unreadable labels file, or a build without ONNX Runtime.
[[nodiscard]] std::shared_ptr<autotag::vision::IRegionDetector> make_region_detector(
    const EngineConfig& config);

/// Engine with the image, PDF, JSON and audio matchers registered, the confidence policy
/// and scan options applied. detector may be nullptr (feature-only visual analysis).
[[nodiscard]] autotag::core::Engine build_engine(
    const EngineConfig& config,
    std::shared_ptr<autotag::vision::IRegionDetector> detector = nullptr);

}  // namespace autotag::app
