#include <autotag/app/mock_content_extractor.hpp>

namespace autotag::app {

void MockContentExtractor::set_content(autotag::core::CandidateContent content) {
  std::lock_guard lock(mutex_);
  content_ = std::move(content);
}

void MockContentExtractor::set_failure(std::optional<autotag::core::EngineError> error) {
  std::lock_guard lock(mutex_);
  failure_ = error;
}

std::expected<autotag::core::CandidateContent, autotag::core::EngineError>
MockContentExtractor::extract(const SourceFile& /*source*/) {
  ++calls_;
  std::lock_guard lock(mutex_);
  if (failure_) {
    return std::unexpected(*failure_);
  }
  return content_;
}

}  // namespace autotag::app
