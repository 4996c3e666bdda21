#pragma once

#include <autotag/core/analysis_result.hpp>
#include <cstddef>
#include <span>
#include <string>

namespace autotag::core {

/// Which confidence the aggregator reports for the winning category.
enum class ConfidencePolicy {
  GlobalMax,  // maximum over every candidate, whatever its category (default)
  WinnerMax,  // maximum over the winning category's own candidates
};

struct AggregateDecision {
  std::string category{kUncategorized};
  double confidence{0.0};
  std::size_t votes{0};
};

/// Reduces the candidates of one matcher run to a single category decision.
///
/// The category with the most candidates wins; ties go to the category seen first in the
/// list. With ConfidencePolicy::GlobalMax the reported confidence is the highest
/// confidence of the whole list, so a well-scored losing category can lift the winner's
/// confidence. An empty list yields {"uncategorized", 0}.
class EvidenceAggregator {
 public:
  explicit EvidenceAggregator(ConfidencePolicy policy = ConfidencePolicy::GlobalMax)
      : policy_(policy) {}

  [[nodiscard]] AggregateDecision aggregate(std::span<const MatchCandidate> candidates) const;

  [[nodiscard]] ConfidencePolicy policy() const noexcept { return policy_; }

 private:
  ConfidencePolicy policy_;
};

}  // namespace autotag::core
