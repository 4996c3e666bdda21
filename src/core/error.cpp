#include <autotag/core/error.hpp>

namespace autotag::core {

std::string_view error_name(EngineError error) noexcept {
  switch (error) {
    case EngineError::None:
      return "None";
    case EngineError::ContentUnavailable:
      return "ContentUnavailable";
    case EngineError::InvalidImage:
      return "InvalidImage";
    case EngineError::UnsupportedFileType:
      return "UnsupportedFileType";
    case EngineError::ExtractionFailed:
      return "ExtractionFailed";
    case EngineError::InvalidConfig:
      return "InvalidConfig";
    case EngineError::MalformedDocument:
      return "MalformedDocument";
  }
  return "Unknown";
}

}  // namespace autotag::core
