#include <autotag/vision/detection_decoder.hpp>
#include <gtest/gtest.h>
#include <sstream>

namespace av = autotag::vision;

TEST(DetectionDecoder, FiltersByThresholdAndSplitsLogos) {
  av::ClassLabelMap labels{{"person", false}, {"acme", true}, {"car", false}};
  av::DetectionDecoder decoder(0.5f, labels);

  av::RawDetections raw;
  raw.num_detections = 4;
  raw.boxes = {0, 0, 1, 1, 0, 0, 1, 1, 0, 0, 1, 1, 0, 0, 1, 1};
  raw.scores = {0.6f, 0.9f, 0.4f, 0.8f};
  raw.class_ids = {0, 1, 2, 2};

  const auto d = decoder.decode(raw);
  ASSERT_EQ(d.objects.size(), 2u);
  EXPECT_EQ(d.objects[0].name, "car");
  EXPECT_FLOAT_EQ(d.objects[0].score, 0.8f);
  EXPECT_EQ(d.objects[1].name, "person");
  ASSERT_EQ(d.logos.size(), 1u);
  EXPECT_EQ(d.logos[0].name, "acme");
}

TEST(DetectionDecoder, UnknownClassIdGetsGenericName) {
  av::DetectionDecoder decoder(0.1f, {});
  av::RawDetections raw;
  raw.num_detections = 1;
  raw.scores = {0.5f};
  raw.class_ids = {7};
  const auto d = decoder.decode(raw);
  ASSERT_EQ(d.objects.size(), 1u);
  EXPECT_EQ(d.objects[0].name, "class_7");
  EXPECT_TRUE(d.logos.empty());
}

TEST(DetectionDecoder, EmptyRawYieldsNothing) {
  av::DetectionDecoder decoder(0.5f, {{"a", false}});
  const auto d = decoder.decode({});
  EXPECT_TRUE(d.objects.empty());
  EXPECT_TRUE(d.logos.empty());
  decoder.set_confidence_threshold(0.2f);
  EXPECT_FLOAT_EQ(decoder.confidence_threshold(), 0.2f);
}

TEST(ClassLabels, ParseCommentsAndLogoPrefix) {
  std::istringstream in("# model classes\nperson\nlogo: acme\n\n  bicycle  \n");
  const auto labels = av::parse_class_labels(in);
  ASSERT_EQ(labels.size(), 4u);
  EXPECT_EQ(labels[0].name, "person");
  EXPECT_FALSE(labels[0].logo);
  EXPECT_EQ(labels[1].name, "acme");
  EXPECT_TRUE(labels[1].logo);
  EXPECT_TRUE(labels[2].name.empty());
  EXPECT_EQ(labels[3].name, "bicycle");
}

TEST(ClassLabels, MissingFileIsUnavailable) {
  auto labels = av::load_class_labels("/nonexistent/autotag_labels_12345.txt");
  ASSERT_FALSE(labels.has_value());
  EXPECT_EQ(labels.error(), autotag::core::EngineError::ContentUnavailable);
}
