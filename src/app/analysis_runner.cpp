#include <autotag/app/analysis_runner.hpp>
#include <autotag/core/candidate.hpp>
#include <autotag/core/logging.hpp>
#include <autotag/core/worker_pool.hpp>
#include <filesystem>
#include <fstream>
#include <vector>

namespace autotag::app {

namespace ac = autotag::core;

namespace {

bool is_readable_file(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) return false;
  std::ifstream f(path, std::ios::binary);
  return static_cast<bool>(f);
}

}  // namespace

AnalysisOutcome run_analysis(const ac::Engine& engine,
                             IContentExtractor& extractor,
                             const SourceFile& source,
                             const std::vector<ac::AnnotationRecord>& corpus,
                             const ac::CategoryDirectory& directory,
                             ac::PhaseTimingCallback* timing_cb) {
  if (!is_readable_file(source.path)) {
    ac::logger()->error("candidate file '{}' is missing or unreadable", source.path);
    return std::unexpected(ac::EngineError::ContentUnavailable);
  }

  SourceFile resolved = source;
  if (resolved.type == ac::FileType::Unknown) {
    resolved.type = ac::file_type_from_path(source.path);
  }
  if (resolved.type == ac::FileType::Unknown) {
    ac::logger()->error("cannot tell the file type of '{}'", source.path);
    return std::unexpected(ac::EngineError::UnsupportedFileType);
  }

  auto content = extractor.extract(resolved);
  if (!content) {
    ac::logger()->error("extraction of '{}' failed: {}", source.path,
                        ac::error_name(content.error()));
    return std::unexpected(content.error());
  }

  auto result = engine.analyze(resolved.type, *content, corpus, directory, timing_cb);
  if (result && !source.file_id.empty()) {
    result->file_id = source.file_id;
  }
  return result;
}

void run_analysis_batch(const ac::Engine& engine,
                        IContentExtractor& extractor,
                        const std::vector<SourceFile>& sources,
                        const std::vector<ac::AnnotationRecord>& corpus,
                        const ac::CategoryDirectory& directory,
                        AnalysisCallback callback) {
  for (const auto& source : sources) {
    auto outcome = run_analysis(engine, extractor, source, corpus, directory);
    if (callback) callback(source, outcome);
  }
}

void run_analysis_batch_parallel(const ac::Engine& engine,
                                 IContentExtractor& extractor,
                                 const std::vector<SourceFile>& sources,
                                 const std::vector<ac::AnnotationRecord>& corpus,
                                 const ac::CategoryDirectory& directory,
                                 AnalysisCallback callback,
                                 std::size_t num_workers) {
  const std::size_t n = sources.size();
  if (n == 0 || !callback) return;

  ac::parallel_for_index(n, num_workers, [&](std::size_t idx) {
    auto outcome = run_analysis(engine, extractor, sources[idx], corpus, directory);
    callback(sources[idx], outcome);
  });
}

}  // namespace autotag::app
