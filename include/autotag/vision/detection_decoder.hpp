#pragma once

#include <autotag/core/error.hpp>
#include <autotag/vision/region_detector.hpp>
#include <cstdint>
#include <expected>
#include <istream>
#include <string>
#include <vector>

namespace autotag::vision {

/// Raw model output (boxes, class scores, etc.) before decoding to named detections.
struct RawDetections {
  std::vector<float> boxes;  // [x1,y1,x2,y2] per detection
  std::vector<float> scores;
  std::vector<std::int64_t> class_ids;
  std::uint32_t num_detections{0};
};

/// Model class: display name and whether the class is a logo rather than an object.
struct ClassLabel {
  std::string name;
  bool logo{false};
};

/// Index = model class id.
using ClassLabelMap = std::vector<ClassLabel>;

/// Decodes RawDetections -> RegionDetection with a confidence threshold.
/// Unknown class ids are reported as objects named "class_<id>".
class DetectionDecoder {
 public:
  DetectionDecoder(float confidence_threshold, ClassLabelMap labels);

  [[nodiscard]] RegionDetection decode(const RawDetections& raw) const;

  void set_confidence_threshold(float t) noexcept { confidence_threshold_ = t; }
  [[nodiscard]] float confidence_threshold() const noexcept { return confidence_threshold_; }

  [[nodiscard]] const ClassLabelMap& labels() const noexcept { return labels_; }

 private:
  float confidence_threshold_;
  ClassLabelMap labels_;
};

/// Parses a labels file: one class per line in class-id order, "logo:" prefix marks a
/// logo class, lines starting with '#' are comments.
[[nodiscard]] ClassLabelMap parse_class_labels(std::istream& in);

/// Errors: ContentUnavailable when the file cannot be opened.
[[nodiscard]] std::expected<ClassLabelMap, autotag::core::EngineError> load_class_labels(
    const std::string& path);

}  // namespace autotag::vision
