#pragma once

#include <string_view>

namespace autotag::core {

/// Engine error codes; used with std::expected for recoverable failures.
/// NoEvidence is not an error: it is reported as an "uncategorized" result.
enum class EngineError {
  None = 0,
  ContentUnavailable,   // source file missing, unreadable or undecodable
  InvalidImage,         // empty or unsupported pixel buffer
  UnsupportedFileType,  // no matcher for the file type, or content of the wrong kind
  ExtractionFailed,     // external OCR / transcription / PDF text provider failed
  InvalidConfig,
  MalformedDocument,    // corpus, category or candidate JSON could not be parsed
};

/// Stable name for logs and CLI messages.
[[nodiscard]] std::string_view error_name(EngineError error) noexcept;

}  // namespace autotag::core
