#pragma once

#include <autotag/core/analysis_result.hpp>
#include <autotag/core/candidate.hpp>
#include <autotag/core/error.hpp>
#include <autotag/core/geometry.hpp>
#include <nlohmann/json.hpp>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace autotag::app {

/// {"x1","y1","x2","y2"}; nullopt unless all four are numbers.
[[nodiscard]] std::optional<autotag::core::BoundingBox> box_from_json(const nlohmann::ordered_json& j);
[[nodiscard]] nlohmann::ordered_json box_to_json(const autotag::core::BoundingBox& box);

[[nodiscard]] nlohmann::ordered_json match_to_json(const autotag::core::MatchCandidate& match);

/// Reads a stored match (e.g. a reference image's visual match). Errors: MalformedDocument.
[[nodiscard]] std::expected<autotag::core::MatchCandidate, autotag::core::EngineError>
match_from_json(const nlohmann::ordered_json& j);

/// Result mirror: {"category","confidence","file_id"?,"matches":[...],"diagnostics":{...}}.
[[nodiscard]] nlohmann::ordered_json result_to_json(const autotag::core::AnalysisResult& result);

/// Word list [{"word","startTime","endTime"}]. Errors: MalformedDocument.
[[nodiscard]] std::expected<std::vector<autotag::core::TranscriptWord>, autotag::core::EngineError>
parse_transcript_words(const nlohmann::ordered_json& j);

/// Pre-extracted candidate description, keyed by "type":
///   pdf:   {"text"}                         json:  {"document"}
///   audio: {"words":[...]}                  image: {"ocr_text", "text_detections":[{"text",
///          "polygon":[{"x","y"}]}], "detected_objects":[{"name","score"}], "image_path"?,
///          "reference_images":[{"file_id","filename","image_path","visual_matches":[...]}]}
/// Relative image paths are resolved against base_dir. Errors: MalformedDocument, or
/// ContentUnavailable when a referenced image cannot be loaded.
[[nodiscard]] std::expected<autotag::core::CandidateContent, autotag::core::EngineError>
parse_candidate_content(const nlohmann::ordered_json& j, const std::string& base_dir = {});

}  // namespace autotag::app
