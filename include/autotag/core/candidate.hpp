#pragma once

#include <autotag/core/analysis_result.hpp>
#include <autotag/core/geometry.hpp>
#include <autotag/core/image.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace autotag::core {

/// Modality of a candidate file; selects the matcher.
enum class FileType : std::uint8_t {
  Unknown,
  Image,
  Pdf,
  Json,
  Audio,
};

[[nodiscard]] std::string_view file_type_name(FileType type) noexcept;

/// Parses "image" / "pdf" / "json" / "audio" (case-insensitive).
[[nodiscard]] FileType file_type_from_name(std::string_view name) noexcept;

/// Detects the file type from the path extension.
[[nodiscard]] FileType file_type_from_path(std::string_view path) noexcept;

/// One OCR word or line with its polygon in candidate pixel coordinates.
struct TextDetection {
  std::string text;
  std::vector<Point> polygon;
};

/// Object or logo reported by a detector.
struct DetectedObject {
  std::string name;
  float score{0.f};
};

/// Previously analysed image and the visual matches stored with it.
struct ReferenceImage {
  std::string file_id;
  std::string filename;
  Image image;
  std::vector<MatchCandidate> visual_matches;
};

/// Extracted image content. text_detections excludes the full-text block.
struct ImageContent {
  std::string ocr_text;
  std::vector<TextDetection> text_detections;
  std::vector<DetectedObject> detected_objects;
  Image image;
  std::vector<ReferenceImage> reference_images;
};

struct PdfContent {
  std::string extracted_text;  // whitespace-normalized document text
  std::vector<std::string> pages;
};

/// Flattened JSON entry: dot/bracket path and scalar value as text.
struct KeyValue {
  std::string path;
  std::string value;

  friend bool operator==(const KeyValue&, const KeyValue&) = default;
};

struct JsonContent {
  std::vector<KeyValue> pairs;
};

struct TranscriptWord {
  std::string word;
  double start_time{0.0};
  double end_time{0.0};
};

struct AudioContent {
  std::vector<TranscriptWord> words;
};

/// Transient per-request content. std::monostate means extraction produced nothing.
using CandidateContent =
    std::variant<std::monostate, ImageContent, PdfContent, JsonContent, AudioContent>;

/// File type the content belongs to; Unknown for std::monostate.
[[nodiscard]] FileType content_file_type(const CandidateContent& content) noexcept;

/// Empty content of the given type (what a failed extraction degrades to).
[[nodiscard]] CandidateContent empty_content(FileType type);

}  // namespace autotag::core
