#include <autotag/match/image_region_matcher.hpp>
#include "candidate_builder.hpp"
#include <autotag/core/corpus_scan.hpp>
#include <autotag/core/logging.hpp>
#include <autotag/match/region_correlator.hpp>
#include <autotag/vision/visual_region.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <iterator>
#include <unordered_map>
#include <unordered_set>
#include <variant>

namespace autotag::match {

namespace ac = autotag::core;
namespace av = autotag::vision;

namespace {

bool is_visual(const ac::MatchCandidate& c) {
  return c.kind == ac::EvidenceKind::ImageVisual || c.kind == ac::EvidenceKind::ImageSimilar;
}

/// First occurrence of every annotation id, in corpus order.
std::vector<ac::PatternEntry> unique_by_annotation_id(std::vector<ac::PatternEntry> entries) {
  std::unordered_set<std::string> seen;
  std::vector<ac::PatternEntry> out;
  out.reserve(entries.size());
  for (const auto& e : entries) {
    if (seen.insert(ac::pattern_id(*e.pattern)).second) out.push_back(e);
  }
  return out;
}

}  // namespace

std::expected<ac::MatchOutput, ac::EngineError> ImageRegionMatcher::match(
    const ac::CandidateContent& content,
    const ac::MatchContext& context) const {
  const auto* image = std::get_if<ac::ImageContent>(&content);
  if (!image) {
    return std::unexpected(ac::EngineError::UnsupportedFileType);
  }
  auto log = ac::logger();

  const auto entries = unique_by_annotation_id(
      ac::collect_patterns(context.corpus, {ac::PatternKind::Image, ac::PatternKind::Visual}));
  if (image->image.empty()) {
    log->info("image candidate has no pixels; visual patterns are skipped");
  }

  av::IRegionDetector* detector = detector_.get();
  const ac::PatternScorer scorer =
      [&](const ac::PatternEntry& entry) -> std::optional<ac::MatchCandidate> {
    if (const auto* text = std::get_if<ac::ImagePattern>(entry.pattern)) {
      if (text->ocr_text.empty()) {
        log->debug("image pattern '{}' has no OCR text; skipped", text->id);
        return std::nullopt;
      }
      const auto hit = correlate_text_region(image->text_detections, text->bounding_box,
                                             text->ocr_text);
      if (!hit) return std::nullopt;

      auto c = detail::make_candidate(entry, context.directory, ac::EvidenceKind::ImageText);
      c.confidence = kTextRegionConfidence;
      c.match_type = "text_region";
      c.text = text->ocr_text;
      c.snippet = image->text_detections[hit->detection_index].text;
      c.bounding_box = hit->box;
      c.annotation_bounding_box = text->bounding_box;
      return c;
    }

    const auto& visual = std::get<ac::VisualPattern>(*entry.pattern);
    if (image->image.empty()) return std::nullopt;
    const auto finding = av::analyze_visual_region(image->image, visual.bounding_box, detector);
    if (!finding) return std::nullopt;

    auto c = detail::make_candidate(entry, context.directory, ac::EvidenceKind::ImageVisual);
    c.confidence = finding->confidence;
    c.match_type = "visual_region";
    c.text = finding->description;
    c.snippet = visual.label;
    c.bounding_box = visual.bounding_box;
    c.annotation_bounding_box = visual.bounding_box;
    return c;
  };

  std::vector<ac::MatchCandidate> scored = ac::scan_patterns(entries, scorer, context.scan);

  // Keep the first visual match per pattern label.
  std::unordered_map<std::string, std::string> label_of;
  for (const auto& e : entries) {
    label_of.emplace(ac::pattern_id(*e.pattern), ac::pattern_label(*e.pattern));
  }
  std::vector<ac::MatchCandidate> text_matches;
  std::vector<ac::MatchCandidate> visual_matches;
  std::unordered_set<std::string> matched_labels;
  for (auto& c : scored) {
    if (!is_visual(c)) {
      text_matches.push_back(std::move(c));
      continue;
    }
    // Unlabelled patterns are never duplicates of each other.
    const std::string& label = label_of[c.pattern.annotation_id];
    if (!label.empty() && !matched_labels.insert(label).second) {
      log->debug("duplicate visual label for pattern '{}'; skipped", c.pattern.annotation_id);
      continue;
    }
    visual_matches.push_back(std::move(c));
  }
  const std::size_t region_visual_count = visual_matches.size();

  std::size_t similar_count = 0;
  if (!visual_matches.empty() && !image->reference_images.empty()) {
    similar_count = propagate_similar(*image, visual_matches);
  }

  ac::MatchOutput output;
  output.candidates = std::move(text_matches);
  const std::size_t text_count = output.candidates.size();
  std::move(visual_matches.begin(), visual_matches.end(), std::back_inserter(output.candidates));

  nlohmann::json diagnostics = {
      {"ocr_text_length", image->ocr_text.size()},
      {"text_detection_count", image->text_detections.size()},
      {"detected_object_count", image->detected_objects.size()},
      {"image_pattern_count", entries.size()},
      {"text_match_count", text_count},
      {"visual_match_count", region_visual_count},
      {"similar_match_count", similar_count},
      {"region_detector", detector_ != nullptr},
  };
  output.diagnostics = diagnostics.dump();
  return output;
}

std::size_t ImageRegionMatcher::propagate_similar(const ac::ImageContent& image,
                                                  std::vector<ac::MatchCandidate>& visual) const {
  auto log = ac::logger();
  const auto target = av::extract_features(image.image);
  if (!target) {
    log->warn("cannot extract features of candidate image ({}); similar images skipped",
              ac::error_name(target.error()));
    return 0;
  }

  std::size_t added = 0;
  for (const auto& ref : image.reference_images) {
    if (ref.visual_matches.empty()) continue;
    const auto features = av::extract_features(ref.image);
    if (!features) {
      log->warn("reference image '{}' unusable ({})", ref.filename,
                ac::error_name(features.error()));
      continue;
    }
    const double similarity = av::compare_features(*target, *features).similarity;
    log->debug("similarity to reference '{}': {:.3f}", ref.filename, similarity);
    if (similarity < similar_image_threshold_) continue;

    for (const auto& stored : ref.visual_matches) {
      const bool present = std::any_of(visual.begin(), visual.end(), [&](const auto& c) {
        return c.text == stored.text && c.category == stored.category;
      });
      if (present) continue;

      ac::MatchCandidate c;
      c.pattern = {ref.file_id, "similar_" + ref.file_id + "_" + stored.pattern.annotation_id};
      c.category = stored.category;
      c.confidence = ac::clamp_confidence(std::min(kSimilarImageCeiling,
                                                   stored.confidence * similarity));
      if (c.confidence <= 0.0) continue;
      c.kind = ac::EvidenceKind::ImageSimilar;
      c.match_type = "similar_image";
      c.text = stored.text + " (similar to " + ref.filename + ")";
      c.snippet = stored.text;
      c.bounding_box = stored.bounding_box;
      visual.push_back(std::move(c));
      ++added;
    }
  }
  return added;
}

}  // namespace autotag::match
