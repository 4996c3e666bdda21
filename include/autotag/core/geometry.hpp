#pragma once

#include <optional>
#include <span>

namespace autotag::core {

/// Pixel-space point (OCR polygon vertex).
struct Point {
  double x{0.0};
  double y{0.0};
};

/// Axis-aligned bounding box in pixel coordinates, corners (x1,y1) top-left and (x2,y2) bottom-right.
struct BoundingBox {
  double x1{0.0};
  double y1{0.0};
  double x2{0.0};
  double y2{0.0};

  [[nodiscard]] double width() const noexcept { return x2 - x1; }
  [[nodiscard]] double height() const noexcept { return y2 - y1; }
  [[nodiscard]] double area() const noexcept;
};

/// Smallest box enclosing the polygon. Polygons with fewer than 4 vertices are rejected.
[[nodiscard]] std::optional<BoundingBox> box_from_polygon(std::span<const Point> vertices);

/// Standard axis-aligned intersection: true unless the boxes are disjoint on either axis.
/// Boxes that only touch along an edge overlap.
[[nodiscard]] bool boxes_overlap(const BoundingBox& a, const BoundingBox& b) noexcept;

/// Intersection over union; 0 when the union has no area.
[[nodiscard]] double intersection_over_union(const BoundingBox& a, const BoundingBox& b) noexcept;

}  // namespace autotag::core
