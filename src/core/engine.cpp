#include <autotag/core/engine.hpp>
#include <autotag/core/logging.hpp>
#include <chrono>
#include <variant>

namespace autotag::core {

namespace {

double elapsed_ms(std::chrono::steady_clock::time_point start) {
  const auto end = std::chrono::steady_clock::now();
  return 1e-3 * static_cast<double>(
      std::chrono::duration_cast<std::chrono::microseconds>(end - start).count());
}

}  // namespace

void Engine::add_matcher(std::unique_ptr<IModalityMatcher> matcher) {
  if (!matcher) return;
  for (auto& existing : matchers_) {
    if (existing->file_type() == matcher->file_type()) {
      existing = std::move(matcher);
      return;
    }
  }
  matchers_.push_back(std::move(matcher));
}

const IModalityMatcher* Engine::matcher_for(FileType file_type) const noexcept {
  for (const auto& m : matchers_) {
    if (m->file_type() == file_type) return m.get();
  }
  return nullptr;
}

std::expected<AnalysisResult, EngineError> Engine::analyze(
    FileType file_type,
    const CandidateContent& content,
    const std::vector<AnnotationRecord>& corpus,
    const CategoryDirectory& directory,
    PhaseTimingCallback* timing_cb) const {
  const IModalityMatcher* matcher = matcher_for(file_type);
  if (!matcher) {
    logger()->error("no matcher registered for file type '{}'", file_type_name(file_type));
    return std::unexpected(EngineError::UnsupportedFileType);
  }

  AnalysisResult result;
  if (std::holds_alternative<std::monostate>(content)) {
    logger()->warn("no content extracted for {} candidate; reporting uncategorized",
                   file_type_name(file_type));
    result.diagnostics = R"({"content":"empty"})";
    return result;
  }
  if (content_file_type(content) != file_type) {
    return std::unexpected(EngineError::UnsupportedFileType);
  }

  const MatchContext context{corpus, directory, scan_};
  const auto match_start = std::chrono::steady_clock::now();
  auto output = matcher->match(content, context);
  if (timing_cb) {
    (*timing_cb)("match", elapsed_ms(match_start));
  }
  if (!output) {
    return std::unexpected(output.error());
  }

  const auto aggregate_start = std::chrono::steady_clock::now();
  const AggregateDecision decision = aggregator_.aggregate(output->candidates);
  if (timing_cb) {
    (*timing_cb)("aggregate", elapsed_ms(aggregate_start));
  }

  result.category = decision.category;
  result.confidence = decision.confidence;
  result.matches = std::move(output->candidates);
  result.diagnostics = std::move(output->diagnostics);

  logger()->debug("{} analysis: category='{}' confidence={:.3f} matches={}",
                  file_type_name(file_type), result.category, result.confidence,
                  result.matches.size());
  return result;
}

std::expected<AnalysisResult, EngineError> Engine::analyze(
    const AnalysisRequest& request,
    PhaseTimingCallback* timing_cb) const {
  return analyze(request.file_type, request.content, request.corpus, request.directory,
                 timing_cb);
}

}  // namespace autotag::core
