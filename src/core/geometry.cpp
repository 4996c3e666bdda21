#include <autotag/core/geometry.hpp>
#include <algorithm>

namespace autotag::core {

double BoundingBox::area() const noexcept {
  const double w = width();
  const double h = height();
  return (w > 0.0 && h > 0.0) ? w * h : 0.0;
}

std::optional<BoundingBox> box_from_polygon(std::span<const Point> vertices) {
  if (vertices.size() < 4) return std::nullopt;

  BoundingBox box{vertices[0].x, vertices[0].y, vertices[0].x, vertices[0].y};
  for (const auto& v : vertices.subspan(1)) {
    box.x1 = std::min(box.x1, v.x);
    box.y1 = std::min(box.y1, v.y);
    box.x2 = std::max(box.x2, v.x);
    box.y2 = std::max(box.y2, v.y);
  }
  return box;
}

bool boxes_overlap(const BoundingBox& a, const BoundingBox& b) noexcept {
  return !(a.x2 < b.x1 || a.x1 > b.x2 || a.y2 < b.y1 || a.y1 > b.y2);
}

double intersection_over_union(const BoundingBox& a, const BoundingBox& b) noexcept {
  const double x_overlap = std::max(0.0, std::min(a.x2, b.x2) - std::max(a.x1, b.x1));
  const double y_overlap = std::max(0.0, std::min(a.y2, b.y2) - std::max(a.y1, b.y1));
  const double overlap = x_overlap * y_overlap;
  const double union_area = a.area() + b.area() - overlap;
  return union_area > 0.0 ? overlap / union_area : 0.0;
}

}  // namespace autotag::core
