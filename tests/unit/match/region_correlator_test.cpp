#include <autotag/match/region_correlator.hpp>
#include <gtest/gtest.h>
#include <vector>

namespace ac = autotag::core;
namespace am = autotag::match;

namespace {

ac::TextDetection detection(std::string text, double x1, double y1, double x2, double y2) {
  return {std::move(text), {{x1, y1}, {x2, y1}, {x2, y2}, {x1, y2}}};
}

}  // namespace

TEST(RegionCorrelator, PicksBestOverlappingDetection) {
  const std::vector<ac::TextDetection> dets{
      detection("Invoice", 10, 10, 60, 30),
      detection("Invoice No. 4711 / 2024-03", 10, 10, 120, 30),
      detection("Invoice No.", 500, 500, 560, 520),
  };
  auto hit = am::correlate_text_region(dets, {0, 0, 130, 40}, "Invoice No.");
  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(hit->detection_index, 0u);
  EXPECT_NEAR(hit->score, 7.0 / 11.0, 1e-12);
  EXPECT_DOUBLE_EQ(hit->box.x2, 60.0);
}

TEST(RegionCorrelator, FirstOfEqualScoresWins) {
  const std::vector<ac::TextDetection> dets{
      detection("TOTAL", 0, 0, 10, 10),
      detection("total", 5, 5, 15, 15),
  };
  auto hit = am::correlate_text_region(dets, {0, 0, 20, 20}, "Total");
  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(hit->detection_index, 0u);
  EXPECT_DOUBLE_EQ(hit->score, 1.0);
}

TEST(RegionCorrelator, NoOverlapOrTextMeansNoMatch) {
  const std::vector<ac::TextDetection> dets{
      detection("Total", 100, 100, 150, 120),
      detection("Amount", 0, 0, 50, 20),
      {"Total", {{0, 0}, {10, 0}, {10, 10}}},
  };
  EXPECT_FALSE(am::correlate_text_region(dets, {0, 0, 60, 30}, "Total").has_value());
  EXPECT_FALSE(am::correlate_text_region({}, {0, 0, 60, 30}, "Total").has_value());
}
