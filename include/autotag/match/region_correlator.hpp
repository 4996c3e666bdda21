#pragma once

#include <autotag/core/candidate.hpp>
#include <autotag/core/geometry.hpp>
#include <cstddef>
#include <optional>
#include <span>
#include <string_view>

namespace autotag::match {

/// OCR detection that best matches an annotated text box.
struct TextRegionMatch {
  std::size_t detection_index{0};
  autotag::core::BoundingBox box{};  // detection box in candidate pixels
  double score{0.0};                 // containment length ratio, in (0,1]
};

/// Among detections whose box overlaps annotation_box, picks the one whose text best
/// matches annotation_text (bidirectional case-insensitive containment, scored by length
/// ratio). Detections with fewer than 4 polygon vertices are ignored. Only a strictly
/// higher score replaces the current best, so the first of equal candidates wins.
[[nodiscard]] std::optional<TextRegionMatch> correlate_text_region(
    std::span<const autotag::core::TextDetection> detections,
    const autotag::core::BoundingBox& annotation_box,
    std::string_view annotation_text);

}  // namespace autotag::match
