#ifndef SECTIONPATH_GEOMETRY_HPP
#define SECTIONPATH_GEOMETRY_HPP

// Geometry layer public API
// Builds closed 2D boundaries out of line and arc segments
//
// Usage:
//   PathBuilder path({0.0, 0.0});
//   path.append_line(100.0, 0.0)
//       .append_arc(90.0, 0.0, 10.0)
//       .append_line(50.0, 90.0)
//       .append_line(110.0, 180.0);
//   ClosedPolygon polygon = path.generate_polygon();
//
//   double area = polygon.area();
//   Bounds box = polygon.bounds();

#include "vec2.hpp"
#include "angles.hpp"
#include "polygon.hpp"
#include "path_builder.hpp"

#endif // SECTIONPATH_GEOMETRY_HPP
