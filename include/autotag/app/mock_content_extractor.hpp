#pragma once

#include <autotag/app/content_extractor.hpp>
#include <atomic>
#include <cstddef>
#include <mutex>
#include <optional>

namespace autotag::app {

/// Extractor returning configurable content (or failure) for every file (tests/demo).
class MockContentExtractor : public IContentExtractor {
 public:
  /// Content returned by subsequent extract() calls.
  void set_content(autotag::core::CandidateContent content);

  /// Makes subsequent extract() calls fail with the given error; nullopt clears it.
  void set_failure(std::optional<autotag::core::EngineError> error);

  [[nodiscard]] std::expected<autotag::core::CandidateContent, autotag::core::EngineError>
  extract(const SourceFile& source) override;

  [[nodiscard]] std::size_t calls() const noexcept { return calls_.load(); }

 private:
  mutable std::mutex mutex_;
  autotag::core::CandidateContent content_;
  std::optional<autotag::core::EngineError> failure_;
  std::atomic<std::size_t> calls_{0};
};

}  // namespace autotag::app
