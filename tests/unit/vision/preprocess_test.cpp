#include <autotag/core/error.hpp>
#include <autotag/core/image.hpp>
#include <autotag/vision/preprocess.hpp>
#include <gtest/gtest.h>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace ac = autotag::core;
namespace av = autotag::vision;

namespace {

ac::Image make_solid(std::uint32_t w, std::uint32_t h, ac::PixelFormat fmt,
                     std::vector<std::uint8_t> pixel) {
  std::vector<std::byte> buf;
  buf.reserve(static_cast<std::size_t>(w) * h * pixel.size());
  for (std::size_t i = 0; i < static_cast<std::size_t>(w) * h; ++i) {
    for (auto v : pixel) buf.push_back(std::byte{v});
  }
  return ac::Image(w, h, fmt, std::move(buf));
}

std::uint8_t byte_at(const ac::Image& img, std::size_t i) {
  return std::to_integer<std::uint8_t>(img.data()[i]);
}

}  // namespace

TEST(ResizeImage, ProducesTargetSize) {
  const auto in = make_solid(40, 20, ac::PixelFormat::BGR8, {10, 20, 30});
  auto out = av::resize_image(in, 8, 4);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->width(), 8u);
  EXPECT_EQ(out->height(), 4u);
  EXPECT_EQ(out->format(), ac::PixelFormat::BGR8);
  EXPECT_EQ(out->size_bytes(), 8u * 4 * 3);
  EXPECT_EQ(byte_at(*out, 0), 10);
  EXPECT_EQ(byte_at(*out, 2), 30);
}

TEST(ResizeImage, SameSizeIsCopy) {
  const auto in = make_solid(5, 5, ac::PixelFormat::Grayscale8, {77});
  auto out = av::resize_image(in, 5, 5);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->size_bytes(), in.size_bytes());
  EXPECT_EQ(byte_at(*out, 24), 77);
}

TEST(ResizeImage, ZeroTargetIsInvalidConfig) {
  const auto in = make_solid(5, 5, ac::PixelFormat::RGB8, {1, 2, 3});
  auto out = av::resize_image(in, 0, 5);
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), ac::EngineError::InvalidConfig);
}

TEST(ResizeImage, EmptyImageIsInvalid) {
  auto out = av::resize_image(ac::Image{}, 4, 4);
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), ac::EngineError::InvalidImage);
}

TEST(ConvertToRgb, SwapsBgr) {
  const auto in = make_solid(2, 2, ac::PixelFormat::BGR8, {10, 20, 30});
  auto out = av::convert_to_rgb(in);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->format(), ac::PixelFormat::RGB8);
  EXPECT_EQ(byte_at(*out, 0), 30);
  EXPECT_EQ(byte_at(*out, 1), 20);
  EXPECT_EQ(byte_at(*out, 2), 10);
}

TEST(ConvertToRgb, ReplicatesGrayAndDropsAlpha) {
  auto gray = av::convert_to_rgb(make_solid(3, 1, ac::PixelFormat::Grayscale8, {99}));
  ASSERT_TRUE(gray.has_value());
  EXPECT_EQ(gray->size_bytes(), 9u);
  EXPECT_EQ(byte_at(*gray, 0), 99);
  EXPECT_EQ(byte_at(*gray, 2), 99);

  auto rgba = av::convert_to_rgb(make_solid(1, 1, ac::PixelFormat::RGBA8, {1, 2, 3, 255}));
  ASSERT_TRUE(rgba.has_value());
  EXPECT_EQ(rgba->size_bytes(), 3u);
  EXPECT_EQ(byte_at(*rgba, 2), 3);
}

TEST(CropImage, CopiesSubRectangle) {
  std::vector<std::byte> buf(4 * 4);
  for (std::size_t i = 0; i < buf.size(); ++i) buf[i] = std::byte{static_cast<std::uint8_t>(i)};
  const ac::Image in(4, 4, ac::PixelFormat::Grayscale8, std::move(buf));

  auto out = av::crop_image(in, {1, 2, 2, 2});
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->width(), 2u);
  EXPECT_EQ(out->height(), 2u);
  EXPECT_EQ(byte_at(*out, 0), 9);
  EXPECT_EQ(byte_at(*out, 1), 10);
  EXPECT_EQ(byte_at(*out, 2), 13);
  EXPECT_EQ(byte_at(*out, 3), 14);
}

TEST(CropImage, OutOfBoundsIsInvalidImage) {
  const auto in = make_solid(4, 4, ac::PixelFormat::RGB8, {0, 0, 0});
  auto out = av::crop_image(in, {3, 0, 2, 2});
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), ac::EngineError::InvalidImage);
  EXPECT_FALSE(av::crop_image(in, {0, 0, 0, 2}).has_value());
}
