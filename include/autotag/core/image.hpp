#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace autotag::core {

/// Memory: Image owns a single contiguous, tightly packed buffer
/// (std::vector<std::byte>, rows without padding). Use data() for std::span views.
/// Thread-safety: an Image is never mutated by the matchers, so one instance may be
/// read from many scan workers at once.

/// Pixel layout, 8 bits per channel.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  RGB8,
  BGR8,
  RGBA8,
  BGRA8,
};

/// Decoded raster image: dimensions, format and pixel buffer.
class Image {
 public:
  Image() = default;

  Image(std::uint32_t width,
        std::uint32_t height,
        PixelFormat format,
        std::vector<std::byte> buffer)
      : width_(width),
        height_(height),
        format_(format),
        buffer_(std::move(buffer)) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }

  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }
  [[nodiscard]] std::size_t pixel_count() const noexcept {
    return static_cast<std::size_t>(width_) * height_;
  }
  [[nodiscard]] std::size_t channels() const noexcept { return channel_count(format_); }

  /// True when the format is known and the buffer holds at least width*height pixels.
  [[nodiscard]] bool valid() const noexcept;

  [[nodiscard]] static std::size_t channel_count(PixelFormat format) noexcept;

  /// Minimum bytes required for given dimensions and format (for validation).
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format) noexcept;

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> buffer_;
};

}  // namespace autotag::core
