#pragma once

#include <autotag/core/analysis_result.hpp>
#include <autotag/core/annotation.hpp>
#include <autotag/core/candidate.hpp>
#include <autotag/core/corpus_scan.hpp>
#include <autotag/core/error.hpp>
#include <expected>
#include <string>
#include <vector>

namespace autotag::core {

/// Read-only inputs shared by every matcher for one request.
struct MatchContext {
  const std::vector<AnnotationRecord>& corpus;
  const CategoryDirectory& directory;
  ScanOptions scan{};
};

/// Candidates produced by one matcher plus matcher-specific diagnostics (JSON object text).
struct MatchOutput {
  std::vector<MatchCandidate> candidates;
  std::string diagnostics;
};

/// Abstract modality matcher: scans the corpus for patterns of its modality and scores
/// them against the candidate content. Implementations filter patterns by kind themselves.
class IModalityMatcher {
 public:
  virtual ~IModalityMatcher() = default;

  [[nodiscard]] virtual FileType file_type() const noexcept = 0;

  /// Content of another modality yields EngineError::UnsupportedFileType.
  [[nodiscard]] virtual std::expected<MatchOutput, EngineError> match(
      const CandidateContent& content,
      const MatchContext& context) const = 0;
};

}  // namespace autotag::core
