#ifndef SECTIONPATH_GEOMETRY_POLYGON_HPP
#define SECTIONPATH_GEOMETRY_POLYGON_HPP

#include "vec2.hpp"
#include <cstddef>
#include <vector>

namespace sectionpath {

// Ordered vertex list; the closing edge back to the first vertex is implicit
using Ring = std::vector<Point2D>;

// Distance below which two vertices or two edges are considered touching (mm)
constexpr double GEOMETRY_TOLERANCE = 1e-9;

namespace ring {

// Positive for counter-clockwise rings
double signed_area(const Ring& r);

double perimeter(const Ring& r);

// Area-weighted centroid; falls back to the vertex mean for degenerate rings
Point2D centroid(const Ring& r);

// Drops consecutive duplicates, including a trailing copy of the first vertex
Ring remove_duplicates(const Ring& r, double tolerance = GEOMETRY_TOLERANCE);

// No two edges touch other than adjacent edges at their shared vertex
bool is_simple(const Ring& r, double tolerance = GEOMETRY_TOLERANCE);

// Even-odd ray casting; points on the boundary are not reliably classified
bool contains(const Ring& r, const Point2D& p);

bool edges_touch(const Ring& a, const Ring& b, double tolerance = GEOMETRY_TOLERANCE);

Ring reversed(const Ring& r);

}  // namespace ring

struct Bounds {
    double min_x = 0.0;
    double min_y = 0.0;
    double max_x = 0.0;
    double max_y = 0.0;

    double width() const { return max_x - min_x; }
    double height() const { return max_y - min_y; }
};

// Simple outer ring with zero or more holes. Outer rings are stored
// counter-clockwise and holes clockwise regardless of input winding.
class ClosedPolygon {
public:
    ClosedPolygon() = default;

    // Throws InvalidPolygonError unless every ring has at least three distinct
    // points, is simple, and every hole lies strictly inside the outer ring
    explicit ClosedPolygon(Ring outer, std::vector<Ring> holes = {});

    const Ring& outer() const { return outer_; }
    const std::vector<Ring>& holes() const { return holes_; }
    bool empty() const { return outer_.empty(); }

    double area() const;
    double perimeter() const;
    Point2D centroid() const;
    Bounds bounds() const;
    size_t vertex_count() const;
    bool contains(const Point2D& p) const;

    ClosedPolygon translated(const Vec2& offset) const;
    ClosedPolygon rotated(double angle_deg, const Point2D& origin) const;

    // Reflection across the vertical (flip_x) and/or horizontal (flip_y) line through origin
    ClosedPolygon mirrored(bool flip_x, bool flip_y, const Point2D& origin = {}) const;

private:
    struct Trusted {};
    ClosedPolygon(Ring outer, std::vector<Ring> holes, Trusted);

    void normalize_orientation();

    Ring outer_;
    std::vector<Ring> holes_;
};

}  // namespace sectionpath

#endif // SECTIONPATH_GEOMETRY_POLYGON_HPP
