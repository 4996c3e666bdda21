#pragma once

#include <autotag/core/error.hpp>
#include <autotag/core/image.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>

namespace autotag::vision {

/// Images are resampled to this square grid before feature extraction.
inline constexpr std::uint32_t kFeatureGridSize = 64;
inline constexpr std::size_t kHistogramBins = 256;

/// Default whole-image similarity required by find_best_match and similar-image propagation.
inline constexpr double kDefaultSimilarityThreshold = 0.7;

struct RgbColor {
  double r{0.0};
  double g{0.0};
  double b{0.0};
};

/// Fixed-size descriptor of one image. Values are in 8-bit channel units except the
/// histogram, whose bins are pixel fractions summing to 1.
struct ImageFeatures {
  double hash{0.0};  // mean brightness
  RgbColor average_color{};
  double edge_density{0.0};
  double texture_complexity{0.0};
  std::array<double, kHistogramBins> histogram{};
};

/// Pairwise comparison; similarity is the weighted blend of the component scores.
struct ImageComparison {
  double similarity{0.0};
  double feature_distance{0.0};
  double color_distance{0.0};
  double edge_similarity{0.0};
  double texture_similarity{0.0};
  double hash_similarity{0.0};
  double color_similarity{0.0};
  double histogram_similarity{0.0};
};

struct BestMatch {
  std::size_t index{0};
  double similarity{0.0};
};

/// Resizes to the feature grid, converts to RGB and computes the descriptor.
/// Errors: InvalidImage for an empty or malformed buffer.
[[nodiscard]] std::expected<ImageFeatures, autotag::core::EngineError> extract_features(
    const autotag::core::Image& image);

/// Decodes an encoded image (PNG, JPEG, ...) first. Undecodable bytes yield ContentUnavailable.
[[nodiscard]] std::expected<ImageFeatures, autotag::core::EngineError> extract_features(
    std::span<const std::byte> encoded);

/// Symmetric in its arguments; compare_features(a, a).similarity == 1.
[[nodiscard]] ImageComparison compare_features(const ImageFeatures& a,
                                               const ImageFeatures& b) noexcept;

[[nodiscard]] std::expected<ImageComparison, autotag::core::EngineError> compare_images(
    const autotag::core::Image& a,
    const autotag::core::Image& b);

/// Most similar candidate with similarity >= threshold; the first one wins on ties.
[[nodiscard]] std::optional<BestMatch> find_best_match(
    const ImageFeatures& target,
    std::span<const ImageFeatures> candidates,
    double threshold = kDefaultSimilarityThreshold);

}  // namespace autotag::vision
