#include <autotag/core/aggregator.hpp>
#include <algorithm>
#include <string>
#include <unordered_map>
#include <vector>

namespace autotag::core {

AggregateDecision EvidenceAggregator::aggregate(
    std::span<const MatchCandidate> candidates) const {
  AggregateDecision decision;
  if (candidates.empty()) {
    return decision;
  }

  // Insertion order of categories drives the tie-break.
  std::vector<std::string> order;
  std::unordered_map<std::string, std::size_t> counts;
  for (const auto& c : candidates) {
    auto [it, inserted] = counts.try_emplace(c.category, 0);
    if (inserted) order.push_back(c.category);
    ++it->second;
  }

  const std::string* winner = &order.front();
  std::size_t best = counts[order.front()];
  for (const auto& category : order) {
    if (counts[category] > best) {
      best = counts[category];
      winner = &category;
    }
  }

  double confidence = 0.0;
  for (const auto& c : candidates) {
    if (policy_ == ConfidencePolicy::WinnerMax && c.category != *winner) continue;
    confidence = std::max(confidence, c.confidence);
  }

  decision.category = *winner;
  decision.votes = best;
  decision.confidence = clamp_confidence(confidence);
  return decision;
}

}  // namespace autotag::core
