#pragma once

#include <autotag/core/annotation.hpp>
#include <autotag/core/error.hpp>
#include <nlohmann/json.hpp>
#include <expected>
#include <string>
#include <vector>

namespace autotag::app {

/// Source of the annotation corpus.
class ICorpusReader {
 public:
  virtual ~ICorpusReader() = default;

  [[nodiscard]] virtual std::expected<std::vector<autotag::core::AnnotationRecord>,
                                      autotag::core::EngineError>
  read_all() = 0;
};

/// Reads the corpus from a JSON array file:
///   [{"dataId", "type", "rule": {"id", "categoryId"}, "annotations": [{"id", "label",
///     "annotationType", ...kind-specific fields}]}]
/// Malformed patterns and records are skipped with a warning.
class JsonCorpusReader : public ICorpusReader {
 public:
  explicit JsonCorpusReader(std::string path) : path_(std::move(path)) {}

  /// Errors: ContentUnavailable (unreadable file), MalformedDocument (not a JSON array).
  [[nodiscard]] std::expected<std::vector<autotag::core::AnnotationRecord>,
                              autotag::core::EngineError>
  read_all() override;

 private:
  std::string path_;
};

/// One stored pattern by "annotationType" (image, visual, pdf, json, audio_segment).
/// Errors: MalformedDocument for a missing id, unknown type or missing required field.
[[nodiscard]] std::expected<autotag::core::AnnotationPattern, autotag::core::EngineError>
parse_annotation_pattern(const nlohmann::ordered_json& j);

/// Errors: MalformedDocument when j is not an array.
[[nodiscard]] std::expected<std::vector<autotag::core::AnnotationRecord>,
                            autotag::core::EngineError>
parse_corpus(const nlohmann::ordered_json& j);

/// Category array [{"id" (or "_id"), "name"}]. Errors: MalformedDocument.
[[nodiscard]] std::expected<autotag::core::CategoryDirectory, autotag::core::EngineError>
parse_category_directory(const nlohmann::ordered_json& j);

[[nodiscard]] std::expected<autotag::core::CategoryDirectory, autotag::core::EngineError>
load_category_directory(const std::string& path);

}  // namespace autotag::app
