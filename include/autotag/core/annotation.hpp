#pragma once

#include <autotag/core/geometry.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace autotag::core {

/// Category name reported when a rule carries no category id.
inline constexpr std::string_view kUnknownCategory = "unknown";
/// Category name reported when there is no evidence at all.
inline constexpr std::string_view kUncategorized = "uncategorized";

/// Text box drawn on an image and read by OCR at annotation time.
struct ImagePattern {
  std::string id;
  std::string label;
  std::string ocr_text;
  BoundingBox bounding_box{};
  double ocr_confidence{0.0};
};

/// Region drawn around a logo, object or other visual element (no text).
struct VisualPattern {
  std::string id;
  std::string label;
  BoundingBox bounding_box{};
};

/// Keyword highlighted in a PDF.
struct PdfPattern {
  std::string id;
  std::string label;
  std::string keyword_text;
  std::optional<int> page_number;
};

/// Key/value pair picked from a JSON document.
struct JsonPattern {
  std::string id;
  std::string label;
  std::string json_key;
  std::string json_value;
};

/// Transcribed span of an audio recording. Times are seconds into the annotated recording.
struct AudioSegmentPattern {
  std::string id;
  std::string label;
  std::string text;
  std::optional<std::string> keyword_text;
  double start_time{0.0};
  double end_time{0.0};
};

/// One stored pattern; the alternative is the annotation kind.
using AnnotationPattern =
    std::variant<ImagePattern, VisualPattern, PdfPattern, JsonPattern, AudioSegmentPattern>;

/// Pattern kind, in variant alternative order.
enum class PatternKind : std::uint8_t {
  Image,
  Visual,
  Pdf,
  Json,
  AudioSegment,
};

[[nodiscard]] PatternKind pattern_kind(const AnnotationPattern& pattern) noexcept;
[[nodiscard]] const std::string& pattern_id(const AnnotationPattern& pattern) noexcept;
[[nodiscard]] const std::string& pattern_label(const AnnotationPattern& pattern) noexcept;
[[nodiscard]] std::string_view pattern_kind_name(PatternKind kind) noexcept;

/// Annotation rule; links the record's patterns to a category.
struct Rule {
  std::string id;
  std::string category_id;  // empty when the rule has no category
};

/// Immutable corpus entry: every pattern annotated on one previously uploaded file.
struct AnnotationRecord {
  std::string data_id;
  Rule rule;
  std::vector<AnnotationPattern> annotations;
  std::string type;  // file type of the annotated data, e.g. "image", "pdf"
};

struct Category {
  std::string id;
  std::string name;
};

/// Category id -> name lookup. Passed explicitly with every request; never cached globally.
class CategoryDirectory {
 public:
  CategoryDirectory() = default;
  explicit CategoryDirectory(const std::vector<Category>& categories);

  /// Adds or replaces the name for category.id. Entries with an empty id are ignored.
  void add(Category category);

  [[nodiscard]] std::optional<std::string> find_name(std::string_view id) const;

  /// Name to report for a rule: the directory name, else the raw category id,
  /// else "unknown" when the rule has no category id.
  [[nodiscard]] std::string resolve(const Rule& rule) const;

  [[nodiscard]] std::size_t size() const noexcept { return names_.size(); }

 private:
  std::unordered_map<std::string, std::string> names_;
};

}  // namespace autotag::core
