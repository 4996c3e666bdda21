#pragma once

#include <autotag/core/image.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace autotag::vision::detail {

/// Wraps an Image as a cv::Mat (shared, read-only view). Returns nullopt if the format is
/// unknown or the buffer is too small.
std::optional<cv::Mat> image_to_mat(const autotag::core::Image& image);

/// Copies a cv::Mat (continuous or not) into a tightly packed Image.
autotag::core::Image mat_to_image(const cv::Mat& mat, autotag::core::PixelFormat format);

}  // namespace autotag::vision::detail
