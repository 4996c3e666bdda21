#include <autotag/app/json_codec.hpp>
#include <autotag/core/logging.hpp>
#include <autotag/match/json_flatten.hpp>
#include <autotag/match/pdf_keyword_matcher.hpp>
#include <autotag/vision/load_image.hpp>
#include <array>
#include <filesystem>
#include <variant>

namespace autotag::app {

namespace ac = autotag::core;
using Json = nlohmann::ordered_json;

namespace {

std::string string_at(const Json& j, const char* key) {
  const auto it = j.find(key);
  return it != j.end() && it->is_string() ? it->get<std::string>() : std::string{};
}

std::optional<double> number_at(const Json& j, const char* key) {
  const auto it = j.find(key);
  if (it == j.end() || !it->is_number()) return std::nullopt;
  return it->get<double>();
}

std::optional<ac::EvidenceKind> evidence_kind_from_name(std::string_view name) {
  constexpr std::array kinds{ac::EvidenceKind::ImageText,  ac::EvidenceKind::ImageVisual,
                             ac::EvidenceKind::ImageSimilar, ac::EvidenceKind::PdfKeyword,
                             ac::EvidenceKind::JsonKeyValue, ac::EvidenceKind::AudioSegment};
  for (auto kind : kinds) {
    if (ac::evidence_kind_name(kind) == name) return kind;
  }
  return std::nullopt;
}

std::string resolve_path(const std::string& path, const std::string& base_dir) {
  const std::filesystem::path p(path);
  if (p.is_absolute() || base_dir.empty()) return path;
  return (std::filesystem::path(base_dir) / p).string();
}

std::expected<ac::Image, ac::EngineError> load_image_at(const std::string& path,
                                                        const std::string& base_dir) {
  const std::string full = resolve_path(path, base_dir);
  auto image = autotag::vision::load_image(full);
  if (!image) {
    ac::logger()->error("cannot load image '{}'", full);
    return std::unexpected(ac::EngineError::ContentUnavailable);
  }
  return std::move(*image);
}

std::expected<ac::ImageContent, ac::EngineError> parse_image_content(const Json& j,
                                                                     const std::string& base_dir) {
  ac::ImageContent content;
  content.ocr_text = string_at(j, "ocr_text");

  if (const auto it = j.find("text_detections"); it != j.end() && it->is_array()) {
    for (const auto& d : *it) {
      ac::TextDetection det;
      det.text = string_at(d, "text");
      if (const auto poly = d.find("polygon"); poly != d.end() && poly->is_array()) {
        for (const auto& v : *poly) {
          det.polygon.push_back({number_at(v, "x").value_or(0.0), number_at(v, "y").value_or(0.0)});
        }
      }
      content.text_detections.push_back(std::move(det));
    }
  }
  if (const auto it = j.find("detected_objects"); it != j.end() && it->is_array()) {
    for (const auto& o : *it) {
      content.detected_objects.push_back(
          {string_at(o, "name"), static_cast<float>(number_at(o, "score").value_or(0.0))});
    }
  }

  const std::string image_path = string_at(j, "image_path");
  if (!image_path.empty()) {
    auto image = load_image_at(image_path, base_dir);
    if (!image) return std::unexpected(image.error());
    content.image = std::move(*image);
  }

  if (const auto it = j.find("reference_images"); it != j.end() && it->is_array()) {
    for (const auto& r : *it) {
      ac::ReferenceImage ref;
      ref.file_id = string_at(r, "file_id");
      ref.filename = string_at(r, "filename");
      const std::string ref_path = string_at(r, "image_path");
      if (ref_path.empty()) {
        ac::logger()->warn("reference image '{}' has no image_path; skipped", ref.file_id);
        continue;
      }
      auto image = load_image_at(ref_path, base_dir);
      if (!image) {
        ac::logger()->warn("reference image '{}' unavailable; skipped", ref.file_id);
        continue;
      }
      ref.image = std::move(*image);
      if (ref.filename.empty()) {
        ref.filename = std::filesystem::path(ref_path).filename().string();
      }
      if (const auto vm = r.find("visual_matches"); vm != r.end() && vm->is_array()) {
        for (const auto& m : *vm) {
          auto match = match_from_json(m);
          if (!match) {
            ac::logger()->warn("malformed visual match on reference '{}'; skipped", ref.file_id);
            continue;
          }
          ref.visual_matches.push_back(std::move(*match));
        }
      }
      content.reference_images.push_back(std::move(ref));
    }
  }
  return content;
}

}  // namespace

std::optional<ac::BoundingBox> box_from_json(const Json& j) {
  if (!j.is_object()) return std::nullopt;
  const auto x1 = number_at(j, "x1");
  const auto y1 = number_at(j, "y1");
  const auto x2 = number_at(j, "x2");
  const auto y2 = number_at(j, "y2");
  if (!x1 || !y1 || !x2 || !y2) return std::nullopt;
  return ac::BoundingBox{*x1, *y1, *x2, *y2};
}

Json box_to_json(const ac::BoundingBox& box) {
  return Json{{"x1", box.x1}, {"y1", box.y1}, {"x2", box.x2}, {"y2", box.y2}};
}

Json match_to_json(const ac::MatchCandidate& match) {
  Json j;
  j["data_id"] = match.pattern.data_id;
  j["annotation_id"] = match.pattern.annotation_id;
  j["category"] = match.category;
  j["confidence"] = match.confidence;
  j["kind"] = std::string(ac::evidence_kind_name(match.kind));
  j["match_type"] = match.match_type;
  j["text"] = match.text;
  if (!match.snippet.empty()) j["snippet"] = match.snippet;
  if (match.bounding_box) j["bounding_box"] = box_to_json(*match.bounding_box);
  if (match.annotation_bounding_box) {
    j["annotation_bounding_box"] = box_to_json(*match.annotation_bounding_box);
  }
  if (match.page_number) j["page_number"] = *match.page_number;
  if (match.start_time) j["start_time"] = *match.start_time;
  if (match.end_time) j["end_time"] = *match.end_time;
  if (match.matched_key) j["matched_key"] = *match.matched_key;
  if (match.matched_value) j["matched_value"] = *match.matched_value;
  return j;
}

std::expected<ac::MatchCandidate, ac::EngineError> match_from_json(const Json& j) {
  if (!j.is_object()) return std::unexpected(ac::EngineError::MalformedDocument);
  const auto confidence = number_at(j, "confidence");
  const std::string category = string_at(j, "category");
  const std::string text = string_at(j, "text");
  if (!confidence || category.empty() || text.empty()) {
    return std::unexpected(ac::EngineError::MalformedDocument);
  }

  ac::MatchCandidate m;
  m.pattern = {string_at(j, "data_id"), string_at(j, "annotation_id")};
  m.category = category;
  m.confidence = ac::clamp_confidence(*confidence);
  m.kind = evidence_kind_from_name(string_at(j, "kind")).value_or(ac::EvidenceKind::ImageVisual);
  m.match_type = string_at(j, "match_type");
  m.text = text;
  m.snippet = string_at(j, "snippet");
  if (const auto it = j.find("bounding_box"); it != j.end()) m.bounding_box = box_from_json(*it);
  if (const auto it = j.find("annotation_bounding_box"); it != j.end()) {
    m.annotation_bounding_box = box_from_json(*it);
  }
  return m;
}

Json result_to_json(const ac::AnalysisResult& result) {
  Json j;
  j["category"] = result.category;
  j["confidence"] = result.confidence;
  if (result.file_id) j["file_id"] = *result.file_id;
  Json matches = Json::array();
  for (const auto& m : result.matches) {
    matches.push_back(match_to_json(m));
  }
  j["matches"] = std::move(matches);

  Json diagnostics = result.diagnostics.empty()
                         ? Json::object()
                         : Json::parse(result.diagnostics, nullptr, /*allow_exceptions=*/false);
  if (diagnostics.is_discarded()) diagnostics = result.diagnostics;
  j["diagnostics"] = std::move(diagnostics);
  return j;
}

std::expected<std::vector<ac::TranscriptWord>, ac::EngineError> parse_transcript_words(
    const Json& j) {
  if (!j.is_array()) return std::unexpected(ac::EngineError::MalformedDocument);
  std::vector<ac::TranscriptWord> words;
  words.reserve(j.size());
  for (const auto& w : j) {
    if (!w.is_object() || !w.contains("word") || !w["word"].is_string()) {
      return std::unexpected(ac::EngineError::MalformedDocument);
    }
    words.push_back({w["word"].get<std::string>(), number_at(w, "startTime").value_or(0.0),
                     number_at(w, "endTime").value_or(0.0)});
  }
  return words;
}

std::expected<ac::CandidateContent, ac::EngineError> parse_candidate_content(
    const Json& j, const std::string& base_dir) {
  if (!j.is_object()) return std::unexpected(ac::EngineError::MalformedDocument);

  switch (ac::file_type_from_name(string_at(j, "type"))) {
    case ac::FileType::Pdf:
      return autotag::match::make_pdf_content(string_at(j, "text"));
    case ac::FileType::Json: {
      const auto it = j.find("document");
      if (it == j.end()) return std::unexpected(ac::EngineError::MalformedDocument);
      return ac::JsonContent{autotag::match::flatten_json(*it)};
    }
    case ac::FileType::Audio: {
      const auto it = j.find("words");
      if (it == j.end()) return std::unexpected(ac::EngineError::MalformedDocument);
      auto words = parse_transcript_words(*it);
      if (!words) return std::unexpected(words.error());
      return ac::AudioContent{std::move(*words)};
    }
    case ac::FileType::Image: {
      auto image = parse_image_content(j, base_dir);
      if (!image) return std::unexpected(image.error());
      return std::move(*image);
    }
    case ac::FileType::Unknown:
    default:
      return std::unexpected(ac::EngineError::MalformedDocument);
  }
}

}  // namespace autotag::app
