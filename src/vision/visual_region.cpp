#include <autotag/vision/visual_region.hpp>
#include <autotag/core/error.hpp>
#include <autotag/core/logging.hpp>
#include <autotag/vision/preprocess.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>

namespace autotag::vision {

namespace {

std::optional<VisualFinding> fallback_finding(const autotag::core::BoundingBox& box,
                                              autotag::core::EngineError error) {
  auto log = autotag::core::logger();
  log->warn("visual region analysis failed ({}), using area fallback",
            autotag::core::error_name(error));
  if (box.area() >= kFallbackMinArea) {
    return VisualFinding{"Visual Element (fallback)", kFallbackConfidence};
  }
  return std::nullopt;
}

std::optional<VisualFinding> feature_finding(const ImageFeatures& features,
                                             double area,
                                             const VisualThresholds& thresholds,
                                             const char* description) {
  if (has_visual_content(features, thresholds) && area >= thresholds.min_area) {
    return VisualFinding{description, thresholds.confidence};
  }
  return std::nullopt;
}

}  // namespace

bool has_visual_content(const ImageFeatures& features,
                        const VisualThresholds& thresholds) noexcept {
  if (features.texture_complexity > thresholds.texture) return true;
  if (features.edge_density > thresholds.edges) return true;
  return std::any_of(features.histogram.begin(), features.histogram.end(),
                     [&](double bin) { return bin > thresholds.histogram_bin; });
}

std::optional<VisualFinding> analyze_visual_region(const autotag::core::Image& image,
                                                   const autotag::core::BoundingBox& box,
                                                   IRegionDetector* detector) {
  const std::int64_t crop_x = std::max<std::int64_t>(0, std::llround(box.x1));
  const std::int64_t crop_y = std::max<std::int64_t>(0, std::llround(box.y1));
  const std::int64_t crop_w = std::min<std::int64_t>(
      std::llround(box.width()), static_cast<std::int64_t>(image.width()) - crop_x);
  const std::int64_t crop_h = std::min<std::int64_t>(
      std::llround(box.height()), static_cast<std::int64_t>(image.height()) - crop_y);

  if (crop_w <= kMinRegionSide || crop_h <= kMinRegionSide) {
    autotag::core::logger()->debug("visual region too small: {}x{}", crop_w, crop_h);
    return std::nullopt;
  }

  const PixelRect rect{static_cast<std::uint32_t>(crop_x), static_cast<std::uint32_t>(crop_y),
                       static_cast<std::uint32_t>(crop_w), static_cast<std::uint32_t>(crop_h)};
  auto crop = crop_image(image, rect);
  if (!crop) {
    return fallback_finding(box, crop.error());
  }
  auto features = extract_features(*crop);
  if (!features) {
    return fallback_finding(box, features.error());
  }
  const double area = static_cast<double>(crop_w) * static_cast<double>(crop_h);

  if (detector != nullptr) {
    auto detection = detector->detect(*crop);
    if (detection) {
      if (!detection->objects.empty()) {
        const auto& main = detection->objects.front();
        return VisualFinding{"Object: " + main.name,
                             std::min(0.9, 0.5 + static_cast<double>(main.score) * 0.4)};
      }
      if (!detection->logos.empty()) {
        const auto& main = detection->logos.front();
        return VisualFinding{"Logo: " + main.name,
                             std::min(0.9, 0.6 + static_cast<double>(main.score) * 0.3)};
      }
      if (auto finding = feature_finding(*features, area, kDetectorThresholds, "Visual Pattern")) {
        return finding;
      }
      const auto& colors = detection->dominant_color_scores;
      const bool distinct = std::any_of(colors.begin(), colors.end(),
                                        [](double s) { return s > kDominantColorScore; });
      if (distinct && area >= kDetectorThresholds.min_area) {
        return VisualFinding{"Visual Pattern (" + std::to_string(colors.size()) + " colors)",
                             kDominantColorConfidence};
      }
      return std::nullopt;
    }
    autotag::core::logger()->warn("region detector failed ({}), using image features only",
                                  autotag::core::error_name(detection.error()));
  }

  return feature_finding(*features, area, kFeatureOnlyThresholds, "Visual Pattern");
}

}  // namespace autotag::vision
