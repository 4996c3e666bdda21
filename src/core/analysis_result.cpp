#include <autotag/core/analysis_result.hpp>
#include <algorithm>
#include <cmath>

namespace autotag::core {

std::string_view evidence_kind_name(EvidenceKind kind) noexcept {
  switch (kind) {
    case EvidenceKind::ImageText:
      return "image_text";
    case EvidenceKind::ImageVisual:
      return "image_visual";
    case EvidenceKind::ImageSimilar:
      return "image_similar";
    case EvidenceKind::PdfKeyword:
      return "pdf_keyword";
    case EvidenceKind::JsonKeyValue:
      return "json_key_value";
    case EvidenceKind::AudioSegment:
      return "audio_segment";
  }
  return "unknown";
}

double clamp_confidence(double value) noexcept {
  if (std::isnan(value)) return 0.0;
  return std::clamp(value, 0.0, 1.0);
}

}  // namespace autotag::core
