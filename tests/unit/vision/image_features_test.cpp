#include <autotag/core/error.hpp>
#include <autotag/core/image.hpp>
#include <autotag/vision/image_features.hpp>
#include <gtest/gtest.h>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace ac = autotag::core;
namespace av = autotag::vision;

namespace {

ac::Image make_rgb(std::uint32_t w, std::uint32_t h, std::uint8_t r, std::uint8_t g,
                   std::uint8_t b) {
  std::vector<std::byte> buf;
  for (std::size_t i = 0; i < static_cast<std::size_t>(w) * h; ++i) {
    buf.push_back(std::byte{r});
    buf.push_back(std::byte{g});
    buf.push_back(std::byte{b});
  }
  return ac::Image(w, h, ac::PixelFormat::RGB8, std::move(buf));
}

ac::Image make_checkerboard(std::uint32_t w, std::uint32_t h) {
  std::vector<std::byte> buf;
  for (std::uint32_t y = 0; y < h; ++y) {
    for (std::uint32_t x = 0; x < w; ++x) {
      const std::byte v{static_cast<std::uint8_t>(((x / 4 + y / 4) % 2) ? 255 : 0)};
      buf.push_back(v);
      buf.push_back(v);
      buf.push_back(v);
    }
  }
  return ac::Image(w, h, ac::PixelFormat::RGB8, std::move(buf));
}

}  // namespace

TEST(ImageFeatures, SolidColorDescriptor) {
  auto f = av::extract_features(make_rgb(32, 32, 200, 100, 50));
  ASSERT_TRUE(f.has_value());
  EXPECT_NEAR(f->average_color.r, 200.0, 1e-9);
  EXPECT_NEAR(f->average_color.g, 100.0, 1e-9);
  EXPECT_NEAR(f->average_color.b, 50.0, 1e-9);
  EXPECT_NEAR(f->hash, 350.0 / 3.0, 1e-9);
  EXPECT_DOUBLE_EQ(f->edge_density, 0.0);
  EXPECT_DOUBLE_EQ(f->texture_complexity, 0.0);
  EXPECT_DOUBLE_EQ(f->histogram[117], 1.0);
}

TEST(ImageFeatures, EmptyImageIsInvalid) {
  auto f = av::extract_features(ac::Image{});
  ASSERT_FALSE(f.has_value());
  EXPECT_EQ(f.error(), ac::EngineError::InvalidImage);
}

TEST(ImageFeatures, UndecodableBytesAreUnavailable) {
  const std::vector<std::byte> junk(64, std::byte{0x42});
  auto f = av::extract_features(std::span<const std::byte>(junk));
  ASSERT_FALSE(f.has_value());
  EXPECT_EQ(f.error(), ac::EngineError::ContentUnavailable);
}

TEST(ImageFeatures, SimilarityIsReflexive) {
  auto f = av::extract_features(make_checkerboard(64, 64));
  ASSERT_TRUE(f.has_value());
  const auto c = av::compare_features(*f, *f);
  EXPECT_NEAR(c.similarity, 1.0, 1e-9);
  EXPECT_DOUBLE_EQ(c.feature_distance, 0.0);
  EXPECT_DOUBLE_EQ(c.color_distance, 0.0);
}

TEST(ImageFeatures, SimilarityIsSymmetricAndBounded) {
  const std::vector<ac::Image> images{make_rgb(20, 20, 0, 0, 0), make_rgb(30, 10, 255, 255, 255),
                                      make_rgb(16, 16, 12, 200, 90), make_checkerboard(48, 48)};
  for (const auto& a : images) {
    for (const auto& b : images) {
      auto ab = av::compare_images(a, b);
      auto ba = av::compare_images(b, a);
      ASSERT_TRUE(ab.has_value());
      ASSERT_TRUE(ba.has_value());
      EXPECT_DOUBLE_EQ(ab->similarity, ba->similarity);
      EXPECT_GE(ab->similarity, 0.0);
      EXPECT_LE(ab->similarity, 1.0);
    }
  }
}

TEST(ImageFeatures, BlackAndWhiteAreDissimilar) {
  auto c = av::compare_images(make_rgb(8, 8, 0, 0, 0), make_rgb(8, 8, 255, 255, 255));
  ASSERT_TRUE(c.has_value());
  EXPECT_LT(c->similarity, av::kDefaultSimilarityThreshold);
  EXPECT_DOUBLE_EQ(c->histogram_similarity, 0.0);
}

TEST(ImageFeatures, FindBestMatchHonoursThreshold) {
  auto black = av::extract_features(make_rgb(8, 8, 0, 0, 0));
  auto white = av::extract_features(make_rgb(8, 8, 255, 255, 255));
  auto near_black = av::extract_features(make_rgb(8, 8, 4, 4, 4));
  ASSERT_TRUE(black && white && near_black);

  const std::vector<av::ImageFeatures> only_white{*white};
  EXPECT_FALSE(av::find_best_match(*black, only_white).has_value());

  const std::vector<av::ImageFeatures> pool{*white, *near_black, *black};
  auto best = av::find_best_match(*black, pool);
  ASSERT_TRUE(best.has_value());
  EXPECT_EQ(best->index, 2u);
  EXPECT_NEAR(best->similarity, 1.0, 1e-9);
}

TEST(ImageFeatures, FindBestMatchFirstWinsOnTie) {
  auto f = av::extract_features(make_rgb(8, 8, 30, 60, 90));
  ASSERT_TRUE(f.has_value());
  const std::vector<av::ImageFeatures> pool{*f, *f};
  auto best = av::find_best_match(*f, pool, 0.5);
  ASSERT_TRUE(best.has_value());
  EXPECT_EQ(best->index, 0u);
}
