#pragma once

#include <autotag/core/image.hpp>
#include <cstddef>
#include <optional>
#include <span>
#include <string>

namespace autotag::vision {

/// Load an image file into an Image (Grayscale8, BGR8 or BGRA8). Returns nullopt on failure.
std::optional<autotag::core::Image> load_image(const std::string& path);

/// Decode an encoded image (PNG, JPEG, ...) held in memory. Returns nullopt on failure.
std::optional<autotag::core::Image> decode_image(std::span<const std::byte> encoded);

}  // namespace autotag::vision
