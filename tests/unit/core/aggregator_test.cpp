#include <autotag/core/aggregator.hpp>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace ac = autotag::core;

namespace {

ac::MatchCandidate candidate(std::string category, double confidence) {
  ac::MatchCandidate c;
  c.category = std::move(category);
  c.confidence = confidence;
  return c;
}

}  // namespace

TEST(EvidenceAggregator, EmptyListIsUncategorized) {
  ac::EvidenceAggregator agg;
  const auto d = agg.aggregate({});
  EXPECT_EQ(d.category, "uncategorized");
  EXPECT_DOUBLE_EQ(d.confidence, 0.0);
  EXPECT_EQ(d.votes, 0u);
}

TEST(EvidenceAggregator, MajorityWinsWithGlobalMaxConfidence) {
  const std::vector<ac::MatchCandidate> list{candidate("A", 0.9), candidate("A", 0.4),
                                             candidate("B", 0.95)};
  ac::EvidenceAggregator agg;
  const auto d = agg.aggregate(list);
  EXPECT_EQ(d.category, "A");
  EXPECT_DOUBLE_EQ(d.confidence, 0.95);
  EXPECT_EQ(d.votes, 2u);
}

TEST(EvidenceAggregator, WinnerMaxUsesWinningCategoryOnly) {
  const std::vector<ac::MatchCandidate> list{candidate("A", 0.9), candidate("A", 0.4),
                                             candidate("B", 0.95)};
  ac::EvidenceAggregator agg(ac::ConfidencePolicy::WinnerMax);
  const auto d = agg.aggregate(list);
  EXPECT_EQ(d.category, "A");
  EXPECT_DOUBLE_EQ(d.confidence, 0.9);
}

TEST(EvidenceAggregator, TieGoesToFirstSeenCategory) {
  const std::vector<ac::MatchCandidate> list{candidate("Legal", 0.3), candidate("Finance", 0.8),
                                             candidate("Finance", 0.5), candidate("Legal", 0.6)};
  const auto d = ac::EvidenceAggregator{}.aggregate(list);
  EXPECT_EQ(d.category, "Legal");
  EXPECT_DOUBLE_EQ(d.confidence, 0.8);
}

TEST(EvidenceAggregator, ConfidenceStaysInUnitRange) {
  const std::vector<ac::MatchCandidate> list{candidate("A", 1.4)};
  const auto d = ac::EvidenceAggregator{}.aggregate(list);
  EXPECT_DOUBLE_EQ(d.confidence, 1.0);
}
