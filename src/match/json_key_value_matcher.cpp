#include <autotag/match/json_key_value_matcher.hpp>
#include "candidate_builder.hpp"
#include <autotag/core/candidate.hpp>
#include <autotag/core/corpus_scan.hpp>
#include <autotag/core/logging.hpp>
#include <autotag/match/text_similarity.hpp>
#include <nlohmann/json.hpp>
#include <array>
#include <string>
#include <variant>
#include <vector>

namespace autotag::match {

namespace ac = autotag::core;

namespace {

struct LoweredPair {
  std::string path;
  std::string value;
};

/// Empty strings never satisfy containment.
bool mutual_containment(const std::string& a, const std::string& b) {
  if (a.empty() || b.empty()) return false;
  return a.find(b) != std::string::npos || b.find(a) != std::string::npos;
}

enum class Tier { ExactKey, ExactValue, PartialKey, PartialValue };

struct TierRule {
  Tier tier;
  double confidence;
  const char* match_type;
};

constexpr std::array<TierRule, 4> kTiers{{
    {Tier::ExactKey, kExactKeyConfidence, "exact_key"},
    {Tier::ExactValue, kExactValueConfidence, "exact_value"},
    {Tier::PartialKey, kPartialKeyConfidence, "partial_key"},
    {Tier::PartialValue, kPartialValueConfidence, "partial_value"},
}};

bool satisfies(Tier tier, const LoweredPair& pair, const std::string& key, const std::string& value) {
  switch (tier) {
    case Tier::ExactKey:
      return pair.path == key;
    case Tier::ExactValue:
      return pair.value == value;
    case Tier::PartialKey:
      return mutual_containment(pair.path, key);
    case Tier::PartialValue:
      return mutual_containment(pair.value, value);
  }
  return false;
}

}  // namespace

std::expected<ac::MatchOutput, ac::EngineError> JsonKeyValueMatcher::match(
    const ac::CandidateContent& content,
    const ac::MatchContext& context) const {
  const auto* json = std::get_if<ac::JsonContent>(&content);
  if (!json) {
    return std::unexpected(ac::EngineError::UnsupportedFileType);
  }

  std::vector<LoweredPair> lowered;
  lowered.reserve(json->pairs.size());
  for (const auto& kv : json->pairs) {
    lowered.push_back({to_lower(kv.path), to_lower(kv.value)});
  }

  const auto entries = ac::collect_patterns(context.corpus, {ac::PatternKind::Json});
  ac::MatchOutput output;

  if (!json->pairs.empty()) {
    const ac::PatternScorer scorer =
        [&](const ac::PatternEntry& entry) -> std::optional<ac::MatchCandidate> {
      const auto& pattern = std::get<ac::JsonPattern>(*entry.pattern);
      if (pattern.json_key.empty() || pattern.json_value.empty()) {
        ac::logger()->debug("json pattern '{}' lacks key or value; skipped", pattern.id);
        return std::nullopt;
      }
      const std::string key = to_lower(pattern.json_key);
      const std::string value = to_lower(pattern.json_value);

      for (const auto& rule : kTiers) {
        for (std::size_t i = 0; i < lowered.size(); ++i) {
          if (!satisfies(rule.tier, lowered[i], key, value)) continue;

          const auto& pair = json->pairs[i];
          auto c = detail::make_candidate(entry, context.directory, ac::EvidenceKind::JsonKeyValue);
          c.confidence = rule.confidence;
          c.match_type = rule.match_type;
          c.text = pattern.json_key + ": " + pattern.json_value;
          c.snippet = "Key: \"" + pair.path + "\" = Value: \"" + pair.value + "\"";
          c.matched_key = pair.path;
          c.matched_value = pair.value;
          return c;
        }
      }
      return std::nullopt;
    };
    output.candidates = ac::scan_patterns(entries, scorer, context.scan);
  }

  nlohmann::json diagnostics = {
      {"extracted_key_count", json->pairs.size()},
      {"json_pattern_count", entries.size()},
      {"match_count", output.candidates.size()},
  };
  output.diagnostics = diagnostics.dump();
  return output;
}

}  // namespace autotag::match
