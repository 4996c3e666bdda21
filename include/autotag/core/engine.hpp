#pragma once

#include <autotag/core/aggregator.hpp>
#include <autotag/core/analysis_result.hpp>
#include <autotag/core/annotation.hpp>
#include <autotag/core/candidate.hpp>
#include <autotag/core/corpus_scan.hpp>
#include <autotag/core/error.hpp>
#include <autotag/core/matcher.hpp>
#include <expected>
#include <functional>
#include <memory>
#include <string_view>
#include <vector>

namespace autotag::core {

/// Callback for per-phase timing: (phase, duration_ms). Phases are "match" and "aggregate".
using PhaseTimingCallback = std::function<void(std::string_view phase, double duration_ms)>;

/// In-process request: everything one analysis needs, owned by value.
struct AnalysisRequest {
  FileType file_type{FileType::Unknown};
  CandidateContent content;
  std::vector<AnnotationRecord> corpus;
  CategoryDirectory directory;
};

/// Selects the matcher for the candidate's file type, runs it over the corpus and reduces
/// the candidates to one AnalysisResult. Exactly one matcher runs per request.
class Engine {
 public:
  explicit Engine(EvidenceAggregator aggregator = EvidenceAggregator{},
                  ScanOptions scan = {})
      : aggregator_(aggregator), scan_(scan) {}

  /// Registers a matcher; replaces any matcher already registered for the same file type.
  void add_matcher(std::unique_ptr<IModalityMatcher> matcher);

  /// Errors: UnsupportedFileType when no matcher handles file_type or the content belongs
  /// to another modality. Empty content (std::monostate) is not an error: it yields an
  /// "uncategorized" result with zero confidence.
  /// Thread-safe: matchers are not modified during analyze(), so concurrent calls are safe
  /// as long as the registered matchers are.
  [[nodiscard]] std::expected<AnalysisResult, EngineError> analyze(
      FileType file_type,
      const CandidateContent& content,
      const std::vector<AnnotationRecord>& corpus,
      const CategoryDirectory& directory,
      PhaseTimingCallback* timing_cb = nullptr) const;

  [[nodiscard]] std::expected<AnalysisResult, EngineError> analyze(
      const AnalysisRequest& request,
      PhaseTimingCallback* timing_cb = nullptr) const;

  [[nodiscard]] const IModalityMatcher* matcher_for(FileType file_type) const noexcept;

  [[nodiscard]] std::size_t matcher_count() const noexcept { return matchers_.size(); }

  [[nodiscard]] const EvidenceAggregator& aggregator() const noexcept { return aggregator_; }

 private:
  EvidenceAggregator aggregator_;
  ScanOptions scan_;
  std::vector<std::unique_ptr<IModalityMatcher>> matchers_;
};

}  // namespace autotag::core
