#include "image_cv_utils.hpp"
#include <autotag/core/image.hpp>
#include <opencv2/core.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace autotag::vision::detail {

namespace ac = autotag::core;

std::optional<cv::Mat> image_to_mat(const ac::Image& image) {
  if (!image.valid()) return std::nullopt;

  const int w = static_cast<int>(image.width());
  const int h = static_cast<int>(image.height());
  const std::size_t step = static_cast<std::size_t>(image.width()) * image.channels();
  void* data = const_cast<std::byte*>(image.data().data());

  switch (image.format()) {
    case ac::PixelFormat::Grayscale8:
      return cv::Mat(h, w, CV_8UC1, data, step);
    case ac::PixelFormat::RGB8:
    case ac::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, data, step);
    case ac::PixelFormat::RGBA8:
    case ac::PixelFormat::BGRA8:
      return cv::Mat(h, w, CV_8UC4, data, step);
    case ac::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

ac::Image mat_to_image(const cv::Mat& mat, ac::PixelFormat format) {
  if (mat.empty()) return ac::Image();

  // ROIs share the parent's stride; copy them out before a flat memcpy.
  const cv::Mat packed = mat.isContinuous() ? mat : mat.clone();
  const std::uint32_t w = static_cast<std::uint32_t>(packed.cols);
  const std::uint32_t h = static_cast<std::uint32_t>(packed.rows);
  const std::size_t len = packed.total() * packed.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), packed.ptr(), len);
  return ac::Image(w, h, format, std::move(buffer));
}

}  // namespace autotag::vision::detail
