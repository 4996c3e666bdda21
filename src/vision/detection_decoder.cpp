#include <autotag/vision/detection_decoder.hpp>
#include <autotag/core/candidate.hpp>
#include <algorithm>
#include <cstddef>
#include <fstream>
#include <string_view>

namespace autotag::vision {

namespace {

constexpr std::string_view kLogoPrefix = "logo:";

std::string trim(std::string_view s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) return {};
  const auto last = s.find_last_not_of(" \t\r\n");
  return std::string(s.substr(first, last - first + 1));
}

void sort_by_score(std::vector<autotag::core::DetectedObject>& list) {
  std::stable_sort(list.begin(), list.end(),
                   [](const auto& a, const auto& b) { return a.score > b.score; });
}

}  // namespace

DetectionDecoder::DetectionDecoder(float confidence_threshold, ClassLabelMap labels)
    : confidence_threshold_(confidence_threshold), labels_(std::move(labels)) {}

RegionDetection DetectionDecoder::decode(const RawDetections& raw) const {
  RegionDetection out;
  const std::size_t n = static_cast<std::size_t>(raw.num_detections);

  for (std::size_t i = 0; i < n; ++i) {
    const float score = i < raw.scores.size() ? raw.scores[i] : 0.f;
    if (score < confidence_threshold_) {
      continue;
    }

    autotag::core::DetectedObject d;
    d.score = score;
    bool logo = false;
    const std::int64_t cid = i < raw.class_ids.size() ? raw.class_ids[i] : -1;
    if (cid >= 0 && static_cast<std::size_t>(cid) < labels_.size() &&
        !labels_[static_cast<std::size_t>(cid)].name.empty()) {
      d.name = labels_[static_cast<std::size_t>(cid)].name;
      logo = labels_[static_cast<std::size_t>(cid)].logo;
    } else {
      d.name = "class_" + std::to_string(cid);
    }
    (logo ? out.logos : out.objects).push_back(std::move(d));
  }

  sort_by_score(out.objects);
  sort_by_score(out.logos);
  return out;
}

ClassLabelMap parse_class_labels(std::istream& in) {
  ClassLabelMap labels;
  std::string line;
  while (std::getline(in, line)) {
    std::string entry = trim(line);
    if (!entry.empty() && entry.front() == '#') continue;

    ClassLabel label;
    if (entry.starts_with(kLogoPrefix)) {
      label.logo = true;
      entry = trim(std::string_view(entry).substr(kLogoPrefix.size()));
    }
    label.name = std::move(entry);
    labels.push_back(std::move(label));
  }
  return labels;
}

std::expected<ClassLabelMap, autotag::core::EngineError> load_class_labels(
    const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    return std::unexpected(autotag::core::EngineError::ContentUnavailable);
  }
  return parse_class_labels(f);
}

}  // namespace autotag::vision
