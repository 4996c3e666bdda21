#include <autotag/core/corpus_scan.hpp>
#include <autotag/core/worker_pool.hpp>
#include <algorithm>
#include <vector>

namespace autotag::core {

namespace detail {

std::vector<MatchCandidate> collect_scored(std::vector<std::optional<MatchCandidate>>& slots) {
  std::vector<MatchCandidate> out;
  for (auto& slot : slots) {
    if (!slot) continue;
    slot->confidence = clamp_confidence(slot->confidence);
    if (slot->confidence <= 0.0) continue;
    out.push_back(std::move(*slot));
  }
  return out;
}

}  // namespace detail

std::vector<PatternEntry> collect_patterns(
    const std::vector<AnnotationRecord>& corpus,
    std::initializer_list<PatternKind> kinds) {
  std::vector<PatternEntry> entries;
  for (const auto& record : corpus) {
    for (const auto& pattern : record.annotations) {
      const PatternKind kind = pattern_kind(pattern);
      if (std::find(kinds.begin(), kinds.end(), kind) != kinds.end()) {
        entries.push_back({&record, &pattern});
      }
    }
  }
  return entries;
}

std::vector<MatchCandidate> scan_patterns(
    const std::vector<PatternEntry>& entries,
    const PatternScorer& scorer,
    const ScanOptions& options) {
  const std::size_t n = entries.size();
  if (n == 0 || !scorer) return {};

#ifdef AUTOTAG_HAS_TBB
  if (options.use_tbb) {
    return scan_patterns_tbb(entries, scorer);
  }
#endif

  // Each call writes only its own slot; no lock needed on the result vector.
  std::vector<std::optional<MatchCandidate>> slots(n);
  parallel_for_index(n, options.num_workers, [&](std::size_t i) {
    slots[i] = scorer(entries[i]);
  });
  return detail::collect_scored(slots);
}

}  // namespace autotag::core
