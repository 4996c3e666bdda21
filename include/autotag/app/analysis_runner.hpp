#pragma once

#include <autotag/app/content_extractor.hpp>
#include <autotag/core/analysis_result.hpp>
#include <autotag/core/annotation.hpp>
#include <autotag/core/engine.hpp>
#include <autotag/core/error.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <vector>

namespace autotag::app {

/// Outcome of one file in a batch.
using AnalysisOutcome = std::expected<autotag::core::AnalysisResult, autotag::core::EngineError>;

/// Callback for each analysed file; the SourceFile is the element of the batch's sources
/// vector. Must be thread-safe if using run_analysis_batch_parallel.
using AnalysisCallback = std::function<void(const SourceFile&, const AnalysisOutcome&)>;

/// Analyses one file: checks it exists, extracts its content once, runs the engine and tags
/// the result with source.file_id (when set).
/// Errors: ContentUnavailable (missing/unreadable/undecodable file), UnsupportedFileType,
/// and whatever the extractor reports.
[[nodiscard]] AnalysisOutcome run_analysis(
    const autotag::core::Engine& engine,
    IContentExtractor& extractor,
    const SourceFile& source,
    const std::vector<autotag::core::AnnotationRecord>& corpus,
    const autotag::core::CategoryDirectory& directory,
    autotag::core::PhaseTimingCallback* timing_cb = nullptr);

/// Analyses files sequentially; calls callback for each, in input order.
void run_analysis_batch(const autotag::core::Engine& engine,
                        IContentExtractor& extractor,
                        const std::vector<SourceFile>& sources,
                        const std::vector<autotag::core::AnnotationRecord>& corpus,
                        const autotag::core::CategoryDirectory& directory,
                        AnalysisCallback callback);

/// Analyses files on a thread pool. The extractor and the engine's matchers are called from
/// worker threads; callback may be invoked from any worker (must be thread-safe).
/// num_workers 0 = use hardware concurrency.
void run_analysis_batch_parallel(const autotag::core::Engine& engine,
                                 IContentExtractor& extractor,
                                 const std::vector<SourceFile>& sources,
                                 const std::vector<autotag::core::AnnotationRecord>& corpus,
                                 const autotag::core::CategoryDirectory& directory,
                                 AnalysisCallback callback,
                                 std::size_t num_workers = 0);

}  // namespace autotag::app
