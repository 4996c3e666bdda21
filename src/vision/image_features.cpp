#include <autotag/vision/image_features.hpp>
#include <autotag/core/analysis_result.hpp>
#include <autotag/core/error.hpp>
#include <autotag/core/image.hpp>
#include <autotag/vision/load_image.hpp>
#include <autotag/vision/preprocess.hpp>
#include <algorithm>
#include <cmath>
#include <cstddef>

namespace autotag::vision {

using autotag::core::EngineError;
using autotag::core::Image;

namespace {

constexpr double kHashRange = 65535.0;
constexpr double kMaxColorDistance = 441.67;  // sqrt(3 * 255^2)

constexpr double kHashWeight = 0.30;
constexpr double kColorWeight = 0.20;
constexpr double kEdgeWeight = 0.20;
constexpr double kTextureWeight = 0.15;
constexpr double kHistogramWeight = 0.15;

/// Read-only accessor over a tightly packed RGB8 buffer.
class RgbView {
 public:
  explicit RgbView(const Image& rgb)
      : data_(rgb.data()), width_(rgb.width()), height_(rgb.height()) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }

  [[nodiscard]] double channel(std::uint32_t x, std::uint32_t y, std::size_t c) const noexcept {
    const std::size_t idx = (static_cast<std::size_t>(y) * width_ + x) * 3 + c;
    return static_cast<double>(std::to_integer<unsigned>(data_[idx]));
  }

  [[nodiscard]] double brightness(std::uint32_t x, std::uint32_t y) const noexcept {
    return (channel(x, y, 0) + channel(x, y, 1) + channel(x, y, 2)) / 3.0;
  }

 private:
  std::span<const std::byte> data_;
  std::uint32_t width_;
  std::uint32_t height_;
};

ImageFeatures compute_features(const RgbView& view) {
  ImageFeatures f;
  const std::uint32_t w = view.width();
  const std::uint32_t h = view.height();
  const double total = static_cast<double>(w) * h;

  double sum_r = 0.0;
  double sum_g = 0.0;
  double sum_b = 0.0;
  double sum_brightness = 0.0;
  for (std::uint32_t y = 0; y < h; ++y) {
    for (std::uint32_t x = 0; x < w; ++x) {
      const double r = view.channel(x, y, 0);
      const double g = view.channel(x, y, 1);
      const double b = view.channel(x, y, 2);
      sum_r += r;
      sum_g += g;
      sum_b += b;
      sum_brightness += (r + g + b) / 3.0;

      // (r+g+b)/3 never lands on .5, so rounding mode does not matter here.
      const auto gray = static_cast<std::size_t>(std::lround((r + g + b) / 3.0));
      f.histogram[std::min(gray, kHistogramBins - 1)] += 1.0;
    }
  }
  f.hash = sum_brightness / total;
  f.average_color = RgbColor{sum_r / total, sum_g / total, sum_b / total};
  for (double& bin : f.histogram) bin /= total;

  double edge_sum = 0.0;
  double texture_sum = 0.0;
  for (std::uint32_t y = 1; y + 1 < h; ++y) {
    for (std::uint32_t x = 1; x + 1 < w; ++x) {
      const double gx = std::abs(view.channel(x + 1, y, 0) - view.channel(x - 1, y, 0));
      const double gy = std::abs(view.channel(x, y + 1, 0) - view.channel(x, y - 1, 0));
      edge_sum += std::sqrt(gx * gx + gy * gy);

      const double center = view.brightness(x, y);
      double diff = 0.0;
      for (int dy = -1; dy <= 1; ++dy) {
        for (int dx = -1; dx <= 1; ++dx) {
          if (dx == 0 && dy == 0) continue;
          const auto nx = static_cast<std::uint32_t>(static_cast<int>(x) + dx);
          const auto ny = static_cast<std::uint32_t>(static_cast<int>(y) + dy);
          diff += std::abs(center - view.brightness(nx, ny));
        }
      }
      texture_sum += diff / 8.0;
    }
  }
  f.edge_density = edge_sum / total;
  f.texture_complexity = texture_sum / total;
  return f;
}

double relative_similarity(double a, double b) noexcept {
  const double denom = std::max({a, b, 1.0});
  return std::clamp(1.0 - std::abs(a - b) / denom, 0.0, 1.0);
}

double histogram_similarity(const ImageFeatures& a, const ImageFeatures& b) noexcept {
  double sum_min = 0.0;
  double sum_max = 0.0;
  for (std::size_t i = 0; i < kHistogramBins; ++i) {
    sum_min += std::min(a.histogram[i], b.histogram[i]);
    sum_max += std::max(a.histogram[i], b.histogram[i]);
  }
  return sum_max > 0.0 ? sum_min / sum_max : 0.0;
}

}  // namespace

std::expected<ImageFeatures, EngineError> extract_features(const Image& image) {
  if (image.empty() || !image.valid() || image.width() == 0 || image.height() == 0) {
    return std::unexpected(EngineError::InvalidImage);
  }
  auto resized = resize_image(image, kFeatureGridSize, kFeatureGridSize);
  if (!resized) {
    return std::unexpected(resized.error());
  }
  auto rgb = convert_to_rgb(*resized);
  if (!rgb) {
    return std::unexpected(rgb.error());
  }
  return compute_features(RgbView(*rgb));
}

std::expected<ImageFeatures, EngineError> extract_features(std::span<const std::byte> encoded) {
  auto image = decode_image(encoded);
  if (!image) {
    return std::unexpected(EngineError::ContentUnavailable);
  }
  return extract_features(*image);
}

ImageComparison compare_features(const ImageFeatures& a, const ImageFeatures& b) noexcept {
  ImageComparison c;
  c.feature_distance = std::abs(a.hash - b.hash);
  c.hash_similarity = 1.0 - c.feature_distance / kHashRange;

  const double dr = a.average_color.r - b.average_color.r;
  const double dg = a.average_color.g - b.average_color.g;
  const double db = a.average_color.b - b.average_color.b;
  c.color_distance = std::sqrt(dr * dr + dg * dg + db * db);
  c.color_similarity = 1.0 - c.color_distance / kMaxColorDistance;

  c.edge_similarity = relative_similarity(a.edge_density, b.edge_density);
  c.texture_similarity = relative_similarity(a.texture_complexity, b.texture_complexity);
  c.histogram_similarity = histogram_similarity(a, b);

  c.similarity = autotag::core::clamp_confidence(
      kHashWeight * c.hash_similarity + kColorWeight * c.color_similarity +
      kEdgeWeight * c.edge_similarity + kTextureWeight * c.texture_similarity +
      kHistogramWeight * c.histogram_similarity);
  return c;
}

std::expected<ImageComparison, EngineError> compare_images(const Image& a, const Image& b) {
  auto fa = extract_features(a);
  if (!fa) return std::unexpected(fa.error());
  auto fb = extract_features(b);
  if (!fb) return std::unexpected(fb.error());
  return compare_features(*fa, *fb);
}

std::optional<BestMatch> find_best_match(const ImageFeatures& target,
                                         std::span<const ImageFeatures> candidates,
                                         double threshold) {
  std::optional<BestMatch> best;
  for (std::size_t i = 0; i < candidates.size(); ++i) {
    const double similarity = compare_features(target, candidates[i]).similarity;
    if (similarity < threshold) continue;
    if (!best || similarity > best->similarity) {
      best = BestMatch{i, similarity};
    }
  }
  return best;
}

}  // namespace autotag::vision
