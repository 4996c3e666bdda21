#include <autotag/core/annotation.hpp>

namespace autotag::core {

PatternKind pattern_kind(const AnnotationPattern& pattern) noexcept {
  return static_cast<PatternKind>(pattern.index());
}

const std::string& pattern_id(const AnnotationPattern& pattern) noexcept {
  return std::visit([](const auto& p) -> const std::string& { return p.id; }, pattern);
}

const std::string& pattern_label(const AnnotationPattern& pattern) noexcept {
  return std::visit([](const auto& p) -> const std::string& { return p.label; }, pattern);
}

std::string_view pattern_kind_name(PatternKind kind) noexcept {
  switch (kind) {
    case PatternKind::Image:
      return "image";
    case PatternKind::Visual:
      return "visual";
    case PatternKind::Pdf:
      return "pdf";
    case PatternKind::Json:
      return "json";
    case PatternKind::AudioSegment:
      return "audio_segment";
  }
  return "unknown";
}

CategoryDirectory::CategoryDirectory(const std::vector<Category>& categories) {
  for (const auto& c : categories) {
    add(c);
  }
}

void CategoryDirectory::add(Category category) {
  if (category.id.empty()) return;
  names_[std::move(category.id)] = std::move(category.name);
}

std::optional<std::string> CategoryDirectory::find_name(std::string_view id) const {
  const auto it = names_.find(std::string(id));
  if (it == names_.end()) return std::nullopt;
  return it->second;
}

std::string CategoryDirectory::resolve(const Rule& rule) const {
  if (rule.category_id.empty()) return std::string(kUnknownCategory);
  if (auto name = find_name(rule.category_id)) return *name;
  return rule.category_id;
}

}  // namespace autotag::core
