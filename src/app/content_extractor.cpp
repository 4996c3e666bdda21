#include <autotag/app/content_extractor.hpp>
#include <autotag/app/json_codec.hpp>
#include <autotag/core/logging.hpp>
#include <autotag/match/json_flatten.hpp>
#include <autotag/match/pdf_keyword_matcher.hpp>
#include <autotag/vision/load_image.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace autotag::app {

namespace ac = autotag::core;

std::expected<OcrResult, ac::EngineError> IExtractionProvider::recognize_text(
    const ac::Image& /*image*/) {
  return std::unexpected(ac::EngineError::ExtractionFailed);
}

std::expected<std::string, ac::EngineError> IExtractionProvider::pdf_text(
    const std::string& /*path*/) {
  return std::unexpected(ac::EngineError::ExtractionFailed);
}

std::expected<std::vector<ac::TranscriptWord>, ac::EngineError> IExtractionProvider::transcribe(
    const std::string& /*path*/) {
  return std::unexpected(ac::EngineError::ExtractionFailed);
}

std::expected<std::string, ac::EngineError> read_text_file(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    return std::unexpected(ac::EngineError::ContentUnavailable);
  }
  std::ostringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

std::expected<ac::CandidateContent, ac::EngineError> LocalContentExtractor::extract(
    const SourceFile& source) {
  const ac::FileType type = source.type == ac::FileType::Unknown
                                ? ac::file_type_from_path(source.path)
                                : source.type;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(source.path, ec)) {
    ac::logger()->error("source file '{}' not found", source.path);
    return std::unexpected(ac::EngineError::ContentUnavailable);
  }

  switch (type) {
    case ac::FileType::Image: {
      auto image = autotag::vision::load_image(source.path);
      if (!image) {
        ac::logger()->error("cannot decode image '{}'", source.path);
        return std::unexpected(ac::EngineError::ContentUnavailable);
      }
      return extract_image(std::move(*image));
    }
    case ac::FileType::Pdf:
      return extract_pdf(source.path);
    case ac::FileType::Json: {
      auto text = read_text_file(source.path);
      if (!text) return std::unexpected(text.error());
      auto doc = autotag::match::parse_json_document(*text);
      if (!doc) {
        ac::logger()->error("'{}' is not valid JSON", source.path);
        return std::unexpected(ac::EngineError::ContentUnavailable);
      }
      return ac::JsonContent{autotag::match::flatten_json(*doc)};
    }
    case ac::FileType::Audio:
      return extract_audio(source.path);
    case ac::FileType::Unknown:
    default:
      return std::unexpected(ac::EngineError::UnsupportedFileType);
  }
}

ac::ImageContent LocalContentExtractor::extract_image(ac::Image image) const {
  ac::ImageContent content;
  if (provider_) {
    auto ocr = provider_->recognize_text(image);
    if (ocr) {
      content.ocr_text = std::move(ocr->full_text);
      content.text_detections = std::move(ocr->detections);
      content.detected_objects = std::move(ocr->objects);
    } else {
      ac::logger()->warn("OCR failed ({}); continuing without text",
                         ac::error_name(ocr.error()));
    }
  }
  content.image = std::move(image);
  return content;
}

ac::PdfContent LocalContentExtractor::extract_pdf(const std::string& path) const {
  if (provider_) {
    auto text = provider_->pdf_text(path);
    if (text) return autotag::match::make_pdf_content(*text);
    ac::logger()->warn("PDF text extraction failed ({}); trying sidecar",
                       ac::error_name(text.error()));
  }
  auto sidecar = read_text_file(path + ".txt");
  if (!sidecar) {
    ac::logger()->warn("no extracted text for '{}'", path);
    return {};
  }
  return autotag::match::make_pdf_content(*sidecar);
}

ac::AudioContent LocalContentExtractor::extract_audio(const std::string& path) const {
  if (provider_) {
    auto words = provider_->transcribe(path);
    if (words) return ac::AudioContent{std::move(*words)};
    ac::logger()->warn("transcription failed ({}); trying sidecar",
                       ac::error_name(words.error()));
  }
  auto sidecar = read_text_file(path + ".words.json");
  if (!sidecar) {
    ac::logger()->warn("no transcript for '{}'", path);
    return {};
  }
  auto doc = autotag::match::parse_json_document(*sidecar);
  if (!doc) {
    ac::logger()->warn("transcript sidecar for '{}' is not valid JSON", path);
    return {};
  }
  auto words = parse_transcript_words(*doc);
  if (!words) {
    ac::logger()->warn("transcript sidecar for '{}' is malformed", path);
    return {};
  }
  return ac::AudioContent{std::move(*words)};
}

}  // namespace autotag::app
