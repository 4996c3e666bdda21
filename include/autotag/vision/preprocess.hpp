#pragma once

#include <autotag/core/error.hpp>
#include <autotag/core/image.hpp>
#include <cstdint>
#include <expected>

namespace autotag::vision {

/// Integer pixel rectangle (top-left corner plus size).
struct PixelRect {
  std::uint32_t x{0};
  std::uint32_t y{0};
  std::uint32_t width{0};
  std::uint32_t height{0};
};

/// Resizes to a fixed size with bilinear interpolation. Same-size input is copied as is.
[[nodiscard]] std::expected<autotag::core::Image, autotag::core::EngineError> resize_image(
    const autotag::core::Image& input,
    std::uint32_t target_width,
    std::uint32_t target_height);

/// Converts any supported format to RGB8; alpha is dropped, grayscale is replicated.
[[nodiscard]] std::expected<autotag::core::Image, autotag::core::EngineError> convert_to_rgb(
    const autotag::core::Image& input);

/// Copies a sub-rectangle. The rectangle must be non-empty and lie inside the image.
[[nodiscard]] std::expected<autotag::core::Image, autotag::core::EngineError> crop_image(
    const autotag::core::Image& input,
    const PixelRect& rect);

}  // namespace autotag::vision
