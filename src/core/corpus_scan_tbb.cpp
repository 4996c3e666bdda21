#include <autotag/core/corpus_scan.hpp>

#ifdef AUTOTAG_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <cstddef>
#include <optional>
#include <vector>

namespace autotag::core {

std::vector<MatchCandidate> scan_patterns_tbb(
    const std::vector<PatternEntry>& entries,
    const PatternScorer& scorer) {
  if (entries.empty() || !scorer) return {};

  const std::size_t n = entries.size();
  std::vector<std::optional<MatchCandidate>> slots(n);
  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, n),
      [&entries, &scorer, &slots](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          slots[i] = scorer(entries[i]);
        }
      });
  return detail::collect_scored(slots);
}

}  // namespace autotag::core

#endif  // AUTOTAG_HAS_TBB
