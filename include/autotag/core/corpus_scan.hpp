#pragma once

#include <autotag/core/analysis_result.hpp>
#include <autotag/core/annotation.hpp>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <optional>
#include <vector>

namespace autotag::core {

/// Non-owning reference to one stored pattern and the record it belongs to.
/// Valid while the corpus it was collected from is alive and unmodified.
struct PatternEntry {
  const AnnotationRecord* record{nullptr};
  const AnnotationPattern* pattern{nullptr};
};

/// Pure per-pattern scoring function. Returns nullopt when the pattern does not match
/// (or is malformed for its kind). Called concurrently from scan workers; must not write
/// shared state.
using PatternScorer = std::function<std::optional<MatchCandidate>(const PatternEntry&)>;

struct ScanOptions {
  /// Worker threads; 0 = hardware concurrency, 1 = scan on the calling thread.
  std::size_t num_workers{0};
  /// Use tbb::parallel_for instead of the built-in worker pool (needs AUTOTAG_HAS_TBB).
  bool use_tbb{false};
};

/// Collects the corpus patterns of the given kinds, in corpus order.
[[nodiscard]] std::vector<PatternEntry> collect_patterns(
    const std::vector<AnnotationRecord>& corpus,
    std::initializer_list<PatternKind> kinds);

/// Scores every entry and keeps candidates with confidence > 0, clamped to [0,1].
/// Output order equals entry order for any worker count.
[[nodiscard]] std::vector<MatchCandidate> scan_patterns(
    const std::vector<PatternEntry>& entries,
    const PatternScorer& scorer,
    const ScanOptions& options = {});

#ifdef AUTOTAG_HAS_TBB
/// Same contract as scan_patterns, parallelised with tbb::parallel_for.
[[nodiscard]] std::vector<MatchCandidate> scan_patterns_tbb(
    const std::vector<PatternEntry>& entries,
    const PatternScorer& scorer);
#endif

namespace detail {

/// Keeps scored slots with positive confidence, in slot order.
std::vector<MatchCandidate> collect_scored(std::vector<std::optional<MatchCandidate>>& slots);

}  // namespace detail

}  // namespace autotag::core
