#include <autotag/vision/load_image.hpp>
#include "image_cv_utils.hpp"
#include <autotag/core/image.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

namespace autotag::vision {

namespace {

std::optional<autotag::core::Image> to_image(cv::Mat mat) {
  if (mat.empty()) return std::nullopt;

  if (mat.depth() == CV_16U) {
    mat.convertTo(mat, CV_8U, 1.0 / 256.0);
  } else if (mat.depth() != CV_8U) {
    return std::nullopt;
  }

  using autotag::core::PixelFormat;
  switch (mat.channels()) {
    case 1:
      return detail::mat_to_image(mat, PixelFormat::Grayscale8);
    case 3:
      return detail::mat_to_image(mat, PixelFormat::BGR8);
    case 4:
      return detail::mat_to_image(mat, PixelFormat::BGRA8);
    default:
      return std::nullopt;
  }
}

}  // namespace

std::optional<autotag::core::Image> load_image(const std::string& path) {
  return to_image(cv::imread(path, cv::IMREAD_UNCHANGED));
}

std::optional<autotag::core::Image> decode_image(std::span<const std::byte> encoded) {
  if (encoded.empty()) return std::nullopt;
  const cv::Mat raw(1, static_cast<int>(encoded.size()), CV_8UC1,
                    const_cast<std::byte*>(encoded.data()));
  return to_image(cv::imdecode(raw, cv::IMREAD_UNCHANGED));
}

}  // namespace autotag::vision
