#pragma once

#include <autotag/core/candidate.hpp>
#include <autotag/core/matcher.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace autotag::match {

/// Keyword confidence must exceed this for a PDF pattern to count as evidence.
inline constexpr double kDefaultPdfAcceptanceThreshold = 0.1;

/// Scores stored PDF keywords against the candidate's extracted text.
class PdfKeywordMatcher : public autotag::core::IModalityMatcher {
 public:
  explicit PdfKeywordMatcher(double acceptance_threshold = kDefaultPdfAcceptanceThreshold)
      : acceptance_threshold_(acceptance_threshold) {}

  [[nodiscard]] autotag::core::FileType file_type() const noexcept override {
    return autotag::core::FileType::Pdf;
  }

  [[nodiscard]] std::expected<autotag::core::MatchOutput, autotag::core::EngineError> match(
      const autotag::core::CandidateContent& content,
      const autotag::core::MatchContext& context) const override;

  [[nodiscard]] double acceptance_threshold() const noexcept { return acceptance_threshold_; }

 private:
  double acceptance_threshold_;
};

/// Splits raw PDF text into pages on form feeds or gaps of three or more line breaks.
/// Blank pages are dropped; text without any page break is returned as a single page.
[[nodiscard]] std::vector<std::string> split_pages(std::string_view raw_text);

/// Builds PdfContent from raw extracted text (normalized text plus pages).
[[nodiscard]] autotag::core::PdfContent make_pdf_content(std::string_view raw_text);

/// 1-based number of the first page containing keyword (case-insensitive, whitespace
/// normalized), or nullopt.
[[nodiscard]] std::optional<int> find_keyword_page(const std::vector<std::string>& pages,
                                                   std::string_view keyword);

}  // namespace autotag::match
