#include <autotag/vision/preprocess.hpp>
#include "image_cv_utils.hpp"
#include <autotag/core/error.hpp>
#include <autotag/core/image.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <vector>

namespace autotag::vision {

using autotag::core::EngineError;
using autotag::core::Image;
using autotag::core::PixelFormat;

std::expected<Image, EngineError> resize_image(const Image& input,
                                               std::uint32_t target_width,
                                               std::uint32_t target_height) {
  if (target_width == 0 || target_height == 0) {
    return std::unexpected(EngineError::InvalidConfig);
  }
  auto mat_in = detail::image_to_mat(input);
  if (!mat_in) {
    return std::unexpected(EngineError::InvalidImage);
  }

  if (input.width() == target_width && input.height() == target_height) {
    return detail::mat_to_image(*mat_in, input.format());
  }

  cv::Mat mat_out;
  cv::resize(*mat_in, mat_out,
             cv::Size(static_cast<int>(target_width), static_cast<int>(target_height)),
             0, 0, cv::INTER_LINEAR);
  return detail::mat_to_image(mat_out, input.format());
}

std::expected<Image, EngineError> convert_to_rgb(const Image& input) {
  auto mat_in = detail::image_to_mat(input);
  if (!mat_in) {
    return std::unexpected(EngineError::InvalidImage);
  }

  int code = -1;
  switch (input.format()) {
    case PixelFormat::RGB8:
      return detail::mat_to_image(*mat_in, PixelFormat::RGB8);
    case PixelFormat::BGR8:
      code = cv::COLOR_BGR2RGB;
      break;
    case PixelFormat::RGBA8:
      code = cv::COLOR_RGBA2RGB;
      break;
    case PixelFormat::BGRA8:
      code = cv::COLOR_BGRA2RGB;
      break;
    case PixelFormat::Grayscale8:
      code = cv::COLOR_GRAY2RGB;
      break;
    case PixelFormat::Unknown:
    default:
      return std::unexpected(EngineError::InvalidImage);
  }

  cv::Mat mat_out;
  cv::cvtColor(*mat_in, mat_out, code);
  return detail::mat_to_image(mat_out, PixelFormat::RGB8);
}

std::expected<Image, EngineError> crop_image(const Image& input, const PixelRect& rect) {
  auto mat_in = detail::image_to_mat(input);
  if (!mat_in) {
    return std::unexpected(EngineError::InvalidImage);
  }
  if (rect.width == 0 || rect.height == 0 ||
      static_cast<std::uint64_t>(rect.x) + rect.width > input.width() ||
      static_cast<std::uint64_t>(rect.y) + rect.height > input.height()) {
    return std::unexpected(EngineError::InvalidImage);
  }

  const cv::Rect roi(static_cast<int>(rect.x), static_cast<int>(rect.y),
                     static_cast<int>(rect.width), static_cast<int>(rect.height));
  return detail::mat_to_image((*mat_in)(roi), input.format());
}

}  // namespace autotag::vision
