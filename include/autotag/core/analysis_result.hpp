#pragma once

#include <autotag/core/annotation.hpp>
#include <autotag/core/geometry.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace autotag::core {

/// Which matcher path produced a piece of evidence.
enum class EvidenceKind : std::uint8_t {
  ImageText,     // OCR text box correlated with a stored image pattern
  ImageVisual,   // visual region judged meaningful
  ImageSimilar,  // visual match propagated from a similar reference image
  PdfKeyword,
  JsonKeyValue,
  AudioSegment,
};

[[nodiscard]] std::string_view evidence_kind_name(EvidenceKind kind) noexcept;

/// Stored pattern a candidate was derived from.
struct PatternRef {
  std::string data_id;
  std::string annotation_id;
};

/// One scored piece of evidence linking the candidate file to a category.
/// Optional fields are set only by the matchers they belong to.
struct MatchCandidate {
  PatternRef pattern;
  std::string category;
  double confidence{0.0};
  EvidenceKind kind{EvidenceKind::PdfKeyword};
  std::string match_type;  // e.g. "exact", "partial", "exact_key", "segment_text"
  std::string text;        // stored pattern text, or the visual description
  std::string snippet;     // matched fragment of the candidate, for display

  std::optional<BoundingBox> bounding_box;             // where it matched in the candidate
  std::optional<BoundingBox> annotation_bounding_box;  // where it was annotated
  std::optional<int> page_number;
  std::optional<double> start_time;
  std::optional<double> end_time;
  std::optional<std::string> matched_key;
  std::optional<std::string> matched_value;
};

/// Result of analysing one candidate file; handed to the external persistence layer.
struct AnalysisResult {
  std::string category{kUncategorized};
  double confidence{0.0};
  std::vector<MatchCandidate> matches;
  std::string diagnostics;  // JSON object text, matcher specific

  /// Identifier of the analysed file. Set by the analysis runner.
  std::optional<std::string> file_id;
};

/// Clamps to [0,1]; NaN becomes 0.
[[nodiscard]] double clamp_confidence(double value) noexcept;

}  // namespace autotag::core
