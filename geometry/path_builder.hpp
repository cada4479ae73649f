#ifndef SECTIONPATH_GEOMETRY_PATH_BUILDER_HPP
#define SECTIONPATH_GEOMETRY_PATH_BUILDER_HPP

#include "vec2.hpp"
#include "polygon.hpp"
#include <cstddef>

namespace sectionpath {

// Turtle-style boundary builder. Angles are degrees, counter-clockwise from +x.
//
// Usage:
//   ClosedPolygon square = PathBuilder()
//       .append_line(1.0, 0.0)
//       .append_line(1.0, 90.0)
//       .append_line(1.0, 180.0)
//       .generate_polygon();
//
// The path is closed implicitly back to the start point. Once a ring or
// polygon has been generated the builder rejects further use.
class PathBuilder {
public:
    static constexpr double DEFAULT_MAX_SEGMENT_ANGLE = 5.0;

    explicit PathBuilder(const Point2D& start = {},
                         double max_segment_angle = DEFAULT_MAX_SEGMENT_ANGLE);

    // Negative length walks backwards along angle
    PathBuilder& append_line(double length, double angle);

    // sweep > 0 turns counter-clockwise, sweep < 0 clockwise; angle is the
    // tangent at the arc start. Zero sweep or zero radius appends nothing.
    PathBuilder& append_arc(double sweep, double angle, double radius);
    PathBuilder& append_arc(double sweep, double angle, double radius, double max_segment_angle);

    // Validated ring in builder coordinates; finalizes the builder
    Ring close_ring();

    // Single-ring polygon, optionally moved so its centroid is at the origin
    ClosedPolygon generate_polygon(bool transform_centroid = true);

    const Ring& points() const { return points_; }
    const Point2D& current_point() const { return points_.back(); }
    double max_segment_angle() const { return max_segment_angle_; }
    bool finalized() const { return finalized_; }

private:
    void ensure_building() const;

    Ring points_;
    double max_segment_angle_;
    bool finalized_ = false;
};

// Number of chords used to tessellate an arc
size_t arc_segment_count(double sweep, double max_segment_angle);

}  // namespace sectionpath

#endif // SECTIONPATH_GEOMETRY_PATH_BUILDER_HPP
