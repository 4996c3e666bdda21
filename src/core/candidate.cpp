#include <autotag/core/candidate.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace autotag::core {

namespace {

// ASCII case-insensitive equality; `lower` must already be lower case.
bool equals_lower(std::string_view s, std::string_view lower) noexcept {
  return std::equal(s.begin(), s.end(), lower.begin(), lower.end(), [](char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) == static_cast<unsigned char>(b);
  });
}

constexpr std::array<std::pair<std::string_view, FileType>, 13> kExtensions{{
    {".png", FileType::Image},
    {".jpg", FileType::Image},
    {".jpeg", FileType::Image},
    {".bmp", FileType::Image},
    {".webp", FileType::Image},
    {".tif", FileType::Image},
    {".tiff", FileType::Image},
    {".pdf", FileType::Pdf},
    {".json", FileType::Json},
    {".wav", FileType::Audio},
    {".mp3", FileType::Audio},
    {".flac", FileType::Audio},
    {".ogg", FileType::Audio},
}};

}  // namespace

std::string_view file_type_name(FileType type) noexcept {
  switch (type) {
    case FileType::Image:
      return "image";
    case FileType::Pdf:
      return "pdf";
    case FileType::Json:
      return "json";
    case FileType::Audio:
      return "audio";
    case FileType::Unknown:
    default:
      return "unknown";
  }
}

FileType file_type_from_name(std::string_view name) noexcept {
  if (equals_lower(name, "image")) return FileType::Image;
  if (equals_lower(name, "pdf")) return FileType::Pdf;
  if (equals_lower(name, "json")) return FileType::Json;
  if (equals_lower(name, "audio")) return FileType::Audio;
  return FileType::Unknown;
}

FileType file_type_from_path(std::string_view path) noexcept {
  const auto dot = path.rfind('.');
  if (dot == std::string_view::npos) return FileType::Unknown;
  const std::string_view ext = path.substr(dot);
  for (const auto& [e, type] : kExtensions) {
    if (equals_lower(ext, e)) return type;
  }
  return FileType::Unknown;
}

FileType content_file_type(const CandidateContent& content) noexcept {
  switch (content.index()) {
    case 1:
      return FileType::Image;
    case 2:
      return FileType::Pdf;
    case 3:
      return FileType::Json;
    case 4:
      return FileType::Audio;
    default:
      return FileType::Unknown;
  }
}

CandidateContent empty_content(FileType type) {
  switch (type) {
    case FileType::Image:
      return ImageContent{};
    case FileType::Pdf:
      return PdfContent{};
    case FileType::Json:
      return JsonContent{};
    case FileType::Audio:
      return AudioContent{};
    case FileType::Unknown:
    default:
      return std::monostate{};
  }
}

}  // namespace autotag::core
