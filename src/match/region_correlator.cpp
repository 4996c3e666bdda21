#include <autotag/match/region_correlator.hpp>
#include <autotag/match/text_similarity.hpp>

namespace autotag::match {

std::optional<TextRegionMatch> correlate_text_region(
    std::span<const autotag::core::TextDetection> detections,
    const autotag::core::BoundingBox& annotation_box,
    std::string_view annotation_text) {
  std::optional<TextRegionMatch> best;
  for (std::size_t i = 0; i < detections.size(); ++i) {
    const auto box = autotag::core::box_from_polygon(detections[i].polygon);
    if (!box || !autotag::core::boxes_overlap(*box, annotation_box)) continue;

    const double score = containment_ratio(detections[i].text, annotation_text);
    if (score > (best ? best->score : 0.0)) {
      best = TextRegionMatch{i, *box, score};
    }
  }
  return best;
}

}  // namespace autotag::match
