#include <autotag/match/pdf_keyword_matcher.hpp>
#include "candidate_builder.hpp"
#include <autotag/core/corpus_scan.hpp>
#include <autotag/core/logging.hpp>
#include <autotag/match/text_similarity.hpp>
#include <nlohmann/json.hpp>
#include <cctype>
#include <variant>

namespace autotag::match {

namespace ac = autotag::core;

namespace {

bool is_blank(std::string_view s) {
  for (char c : s) {
    if (!std::isspace(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

/// End of a page break starting at i, or npos. A break is a form feed, or a newline followed
/// by a whitespace run holding at least two more newlines (the break ends at the last one).
std::size_t page_break_end(std::string_view text, std::size_t i) {
  if (text[i] == '\f') return i + 1;
  if (text[i] != '\n') return std::string_view::npos;

  std::size_t newlines = 0;
  std::size_t last_newline = i;
  for (std::size_t j = i; j < text.size() && std::isspace(static_cast<unsigned char>(text[j])); ++j) {
    if (text[j] == '\f') break;
    if (text[j] == '\n') {
      ++newlines;
      last_newline = j;
    }
  }
  return newlines >= 3 ? last_newline + 1 : std::string_view::npos;
}

}  // namespace

std::vector<std::string> split_pages(std::string_view raw_text) {
  std::vector<std::string> pages;
  std::size_t page_start = 0;
  std::size_t i = 0;
  while (i < raw_text.size()) {
    const std::size_t end = page_break_end(raw_text, i);
    if (end == std::string_view::npos) {
      ++i;
      continue;
    }
    const auto page = raw_text.substr(page_start, i - page_start);
    if (!is_blank(page)) pages.emplace_back(page);
    page_start = end;
    i = end;
  }
  const auto tail = raw_text.substr(page_start);
  if (!is_blank(tail)) pages.emplace_back(tail);

  if (pages.empty() && !raw_text.empty()) pages.emplace_back(raw_text);
  return pages;
}

ac::PdfContent make_pdf_content(std::string_view raw_text) {
  ac::PdfContent content;
  content.extracted_text = normalize_whitespace(raw_text);
  content.pages = split_pages(raw_text);
  return content;
}

std::optional<int> find_keyword_page(const std::vector<std::string>& pages,
                                     std::string_view keyword) {
  const std::string needle = normalize_whitespace(keyword);
  for (std::size_t i = 0; i < pages.size(); ++i) {
    if (contains_case_insensitive(normalize_whitespace(pages[i]), needle)) {
      return static_cast<int>(i + 1);
    }
  }
  return std::nullopt;
}

std::expected<ac::MatchOutput, ac::EngineError> PdfKeywordMatcher::match(
    const ac::CandidateContent& content,
    const ac::MatchContext& context) const {
  const auto* pdf = std::get_if<ac::PdfContent>(&content);
  if (!pdf) {
    return std::unexpected(ac::EngineError::UnsupportedFileType);
  }

  const auto entries = ac::collect_patterns(context.corpus, {ac::PatternKind::Pdf});
  ac::MatchOutput output;

  if (!pdf->extracted_text.empty()) {
    const double threshold = acceptance_threshold_;
    const ac::PatternScorer scorer =
        [&](const ac::PatternEntry& entry) -> std::optional<ac::MatchCandidate> {
      const auto& pattern = std::get<ac::PdfPattern>(*entry.pattern);
      if (pattern.keyword_text.empty()) {
        ac::logger()->debug("pdf pattern '{}' has no keyword; skipped", pattern.id);
        return std::nullopt;
      }
      const double confidence = keyword_confidence(pdf->extracted_text, pattern.keyword_text);
      if (confidence <= threshold) return std::nullopt;

      auto c = detail::make_candidate(entry, context.directory, ac::EvidenceKind::PdfKeyword);
      c.confidence = confidence;
      c.match_type = std::string(keyword_match_type(pdf->extracted_text, pattern.keyword_text,
                                                    confidence));
      c.text = pattern.keyword_text;
      if (const auto offset = find_case_insensitive(pdf->extracted_text, pattern.keyword_text)) {
        c.snippet = make_snippet(pdf->extracted_text, *offset, pattern.keyword_text.size());
      }
      c.page_number = find_keyword_page(pdf->pages, pattern.keyword_text);
      return c;
    };
    output.candidates = ac::scan_patterns(entries, scorer, context.scan);
  } else {
    ac::logger()->info("pdf candidate has no extracted text");
  }

  nlohmann::json diagnostics = {
      {"extracted_text_length", pdf->extracted_text.size()},
      {"page_count", pdf->pages.size()},
      {"pdf_pattern_count", entries.size()},
      {"match_count", output.candidates.size()},
  };
  output.diagnostics = diagnostics.dump();
  return output;
}

}  // namespace autotag::match
