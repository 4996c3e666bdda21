#include <autotag/match/audio_segment_matcher.hpp>
#include "candidate_builder.hpp"
#include <autotag/core/corpus_scan.hpp>
#include <autotag/core/logging.hpp>
#include <autotag/match/text_similarity.hpp>
#include <nlohmann/json.hpp>
#include <unordered_set>
#include <variant>

namespace autotag::match {

namespace ac = autotag::core;

std::string join_transcript(std::span<const ac::TranscriptWord> words) {
  std::string out;
  for (const auto& w : words) {
    if (!out.empty()) out.push_back(' ');
    out += w.word;
  }
  return out;
}

TranscriptStats transcript_stats(std::span<const ac::TranscriptWord> words) {
  TranscriptStats stats;
  if (words.empty()) return stats;

  std::unordered_set<std::string> unique;
  double total_word_duration = 0.0;
  for (const auto& w : words) {
    unique.insert(to_lower(w.word));
    total_word_duration += w.end_time - w.start_time;
  }
  const auto n = static_cast<double>(words.size());
  stats.duration = words.back().end_time;
  stats.word_count = words.size();
  stats.unique_words = unique.size();
  stats.speech_rate = stats.duration > 0.0 ? n / (stats.duration / 60.0) : 0.0;
  stats.vocabulary_diversity = static_cast<double>(unique.size()) / n;
  stats.average_word_duration = total_word_duration / n;
  return stats;
}

std::expected<ac::MatchOutput, ac::EngineError> AudioSegmentMatcher::match(
    const ac::CandidateContent& content,
    const ac::MatchContext& context) const {
  const auto* audio = std::get_if<ac::AudioContent>(&content);
  if (!audio) {
    return std::unexpected(ac::EngineError::UnsupportedFileType);
  }

  const std::string transcript = join_transcript(audio->words);
  const auto entries = ac::collect_patterns(context.corpus, {ac::PatternKind::AudioSegment});
  ac::MatchOutput output;

  if (!transcript.empty()) {
    const ac::PatternScorer scorer =
        [&](const ac::PatternEntry& entry) -> std::optional<ac::MatchCandidate> {
      const auto& pattern = std::get<ac::AudioSegmentPattern>(*entry.pattern);
      const bool has_keyword = pattern.keyword_text && !pattern.keyword_text->empty();
      if (pattern.text.empty() && !has_keyword) {
        ac::logger()->debug("audio pattern '{}' has no text; skipped", pattern.id);
        return std::nullopt;
      }

      const std::string* phrase = nullptr;
      double confidence = 0.0;
      const char* match_type = "";
      std::optional<std::size_t> offset = find_case_insensitive(transcript, pattern.text);
      if (offset) {
        phrase = &pattern.text;
        confidence = kSegmentTextConfidence;
        match_type = "segment_text";
      } else if (has_keyword) {
        offset = find_case_insensitive(transcript, *pattern.keyword_text);
        if (offset) {
          phrase = &*pattern.keyword_text;
          confidence = kSegmentKeywordConfidence;
          match_type = "segment_keyword";
        }
      }
      if (!phrase) return std::nullopt;

      auto c = detail::make_candidate(entry, context.directory, ac::EvidenceKind::AudioSegment);
      c.confidence = confidence;
      c.match_type = match_type;
      c.text = *phrase;
      c.snippet = make_snippet(transcript, *offset, phrase->size());
      c.start_time = pattern.start_time;
      c.end_time = pattern.end_time;
      return c;
    };
    output.candidates = ac::scan_patterns(entries, scorer, context.scan);
  } else {
    ac::logger()->info("audio candidate has an empty transcript");
  }

  const TranscriptStats stats = transcript_stats(audio->words);
  nlohmann::json diagnostics = {
      {"transcript_length", transcript.size()},
      {"duration", stats.duration},
      {"word_count", stats.word_count},
      {"unique_words", stats.unique_words},
      {"speech_rate", stats.speech_rate},
      {"vocabulary_diversity", stats.vocabulary_diversity},
      {"average_word_duration", stats.average_word_duration},
      {"audio_pattern_count", entries.size()},
      {"match_count", output.candidates.size()},
  };
  output.diagnostics = diagnostics.dump();
  return output;
}

}  // namespace autotag::match
