#include <autotag/app/corpus_reader.hpp>
#include <autotag/app/content_extractor.hpp>
#include <autotag/app/json_codec.hpp>
#include <autotag/core/logging.hpp>
#include <autotag/match/json_flatten.hpp>

namespace autotag::app {

namespace ac = autotag::core;
using Json = nlohmann::ordered_json;

namespace {

std::string string_at(const Json& j, const char* key) {
  const auto it = j.find(key);
  return it != j.end() && it->is_string() ? it->get<std::string>() : std::string{};
}

/// Strings as is, other scalars as JSON text (stored values may be numbers or booleans).
std::string scalar_text_at(const Json& j, const char* key) {
  const auto it = j.find(key);
  if (it == j.end() || it->is_null()) return {};
  return it->is_string() ? it->get<std::string>() : it->dump();
}

double number_or_zero(const Json& j, const char* key) {
  const auto it = j.find(key);
  return it != j.end() && it->is_number() ? it->get<double>() : 0.0;
}

std::expected<Json, ac::EngineError> load_json_file(const std::string& path) {
  auto text = read_text_file(path);
  if (!text) {
    ac::logger()->error("cannot read '{}'", path);
    return std::unexpected(text.error());
  }
  auto doc = autotag::match::parse_json_document(*text);
  if (!doc) {
    ac::logger()->error("'{}' is not valid JSON", path);
  }
  return doc;
}

}  // namespace

std::expected<ac::AnnotationPattern, ac::EngineError> parse_annotation_pattern(const Json& j) {
  if (!j.is_object()) return std::unexpected(ac::EngineError::MalformedDocument);
  const std::string id = scalar_text_at(j, "id");
  const std::string type = string_at(j, "annotationType");
  if (id.empty()) return std::unexpected(ac::EngineError::MalformedDocument);
  const std::string label = string_at(j, "label");

  if (type == "image") {
    const auto box = box_from_json(j);  // top-level x1..y2
    if (!box) return std::unexpected(ac::EngineError::MalformedDocument);
    return ac::ImagePattern{id, label, string_at(j, "ocrText"), *box,
                            number_or_zero(j, "ocrConfidence")};
  }
  if (type == "visual") {
    const auto box = box_from_json(j);  // top-level x1..y2
    if (!box) return std::unexpected(ac::EngineError::MalformedDocument);
    return ac::VisualPattern{id, label, *box};
  }
  if (type == "pdf") {
    ac::PdfPattern p{id, label, string_at(j, "keywordText"), std::nullopt};
    if (const auto it = j.find("pageNumber"); it != j.end() && it->is_number_integer()) {
      p.page_number = it->get<int>();
    }
    return p;
  }
  if (type == "json") {
    return ac::JsonPattern{id, label, scalar_text_at(j, "jsonKey"), scalar_text_at(j, "jsonValue")};
  }
  if (type == "audio_segment") {
    ac::AudioSegmentPattern p{id, label, string_at(j, "text"), std::nullopt,
                              number_or_zero(j, "startTime"), number_or_zero(j, "endTime")};
    if (const auto it = j.find("keywordText"); it != j.end() && it->is_string()) {
      p.keyword_text = it->get<std::string>();
    }
    return p;
  }
  return std::unexpected(ac::EngineError::MalformedDocument);
}

std::expected<std::vector<ac::AnnotationRecord>, ac::EngineError> parse_corpus(const Json& j) {
  if (!j.is_array()) return std::unexpected(ac::EngineError::MalformedDocument);
  auto log = ac::logger();

  std::vector<ac::AnnotationRecord> corpus;
  corpus.reserve(j.size());
  std::size_t skipped = 0;
  for (const auto& r : j) {
    if (!r.is_object()) {
      log->warn("corpus entry is not an object; skipped");
      ++skipped;
      continue;
    }
    ac::AnnotationRecord record;
    record.data_id = scalar_text_at(r, "dataId");
    record.type = string_at(r, "type");
    if (const auto rule = r.find("rule"); rule != r.end() && rule->is_object()) {
      record.rule.id = scalar_text_at(*rule, "id");
      record.rule.category_id = scalar_text_at(*rule, "categoryId");
    }
    if (const auto anns = r.find("annotations"); anns != r.end() && anns->is_array()) {
      for (const auto& a : *anns) {
        auto pattern = parse_annotation_pattern(a);
        if (!pattern) {
          log->warn("malformed pattern in record '{}'; skipped", record.data_id);
          ++skipped;
          continue;
        }
        record.annotations.push_back(std::move(*pattern));
      }
    }
    corpus.push_back(std::move(record));
  }
  log->debug("corpus: {} record(s), {} entr(ies) skipped", corpus.size(), skipped);
  return corpus;
}

std::expected<std::vector<ac::AnnotationRecord>, ac::EngineError> JsonCorpusReader::read_all() {
  auto doc = load_json_file(path_);
  if (!doc) return std::unexpected(doc.error());
  return parse_corpus(*doc);
}

std::expected<ac::CategoryDirectory, ac::EngineError> parse_category_directory(const Json& j) {
  if (!j.is_array()) return std::unexpected(ac::EngineError::MalformedDocument);
  ac::CategoryDirectory directory;
  for (const auto& c : j) {
    if (!c.is_object()) continue;
    const std::string name = string_at(c, "name");
    // Both keys may be present; each maps to the same name.
    for (const char* key : {"id", "_id"}) {
      const std::string id = scalar_text_at(c, key);
      if (!id.empty()) directory.add({id, name});
    }
  }
  return directory;
}

std::expected<ac::CategoryDirectory, ac::EngineError> load_category_directory(
    const std::string& path) {
  auto doc = load_json_file(path);
  if (!doc) return std::unexpected(doc.error());
  return parse_category_directory(*doc);
}

}  // namespace autotag::app
