#pragma once

#include <autotag/core/analysis_result.hpp>
#include <autotag/core/annotation.hpp>
#include <autotag/core/corpus_scan.hpp>

namespace autotag::match::detail {

/// Candidate pre-filled with the pattern reference and the rule's category name.
inline autotag::core::MatchCandidate make_candidate(const autotag::core::PatternEntry& entry,
                                                    const autotag::core::CategoryDirectory& directory,
                                                    autotag::core::EvidenceKind kind) {
  autotag::core::MatchCandidate c;
  c.pattern = {entry.record->data_id, autotag::core::pattern_id(*entry.pattern)};
  c.category = directory.resolve(entry.record->rule);
  c.kind = kind;
  return c;
}

}  // namespace autotag::match::detail
