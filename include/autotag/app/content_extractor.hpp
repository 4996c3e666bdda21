#pragma once

#include <autotag/core/candidate.hpp>
#include <autotag/core/error.hpp>
#include <autotag/core/image.hpp>
#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace autotag::app {

/// Candidate file to analyse.
struct SourceFile {
  std::string path;
  autotag::core::FileType type{autotag::core::FileType::Unknown};  // Unknown = from extension
  std::string file_id;  // optional; copied to AnalysisResult::file_id
};

/// Extracts modality-specific content from a candidate file.
/// Implementations must not throw, and must be safe to call from several threads when used
/// with run_analysis_batch_parallel.
class IContentExtractor {
 public:
  virtual ~IContentExtractor() = default;

  /// Errors: ContentUnavailable when the file is missing, unreadable or undecodable.
  /// Failures of external providers are not errors: they yield empty content.
  [[nodiscard]] virtual std::expected<autotag::core::CandidateContent, autotag::core::EngineError>
  extract(const SourceFile& source) = 0;
};

/// OCR output for a whole image.
struct OcrResult {
  std::string full_text;
  std::vector<autotag::core::TextDetection> detections;  // without the full-text block
  std::vector<autotag::core::DetectedObject> objects;
};

/// External OCR / PDF text / transcription provider. Every operation is optional;
/// the defaults report ExtractionFailed.
class IExtractionProvider {
 public:
  virtual ~IExtractionProvider() = default;

  [[nodiscard]] virtual std::expected<OcrResult, autotag::core::EngineError> recognize_text(
      const autotag::core::Image& image);

  [[nodiscard]] virtual std::expected<std::string, autotag::core::EngineError> pdf_text(
      const std::string& path);

  [[nodiscard]] virtual std::expected<std::vector<autotag::core::TranscriptWord>,
                                      autotag::core::EngineError>
  transcribe(const std::string& path);
};

/// Extractor working on local files.
///
/// - image: decoded with OpenCV; OCR from the provider.
/// - pdf: text from the provider, else from a "<path>.txt" sidecar.
/// - json: parsed and flattened.
/// - audio: words from the provider, else from a "<path>.words.json" sidecar
///   (array of {"word", "startTime", "endTime"}).
class LocalContentExtractor : public IContentExtractor {
 public:
  explicit LocalContentExtractor(std::shared_ptr<IExtractionProvider> provider = nullptr)
      : provider_(std::move(provider)) {}

  [[nodiscard]] std::expected<autotag::core::CandidateContent, autotag::core::EngineError>
  extract(const SourceFile& source) override;

 private:
  autotag::core::ImageContent extract_image(autotag::core::Image image) const;
  autotag::core::PdfContent extract_pdf(const std::string& path) const;
  autotag::core::AudioContent extract_audio(const std::string& path) const;

  std::shared_ptr<IExtractionProvider> provider_;
};

/// Reads a whole file. Errors: ContentUnavailable.
[[nodiscard]] std::expected<std::string, autotag::core::EngineError> read_text_file(
    const std::string& path);

}  // namespace autotag::app
