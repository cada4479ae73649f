#include "path_builder.hpp"
#include "errors.hpp"
#include "validation.hpp"
#include "logging.hpp"
#include <cmath>
#include <stdexcept>

namespace sectionpath {

size_t arc_segment_count(double sweep, double max_segment_angle) {
    double n = std::ceil(std::abs(sweep) / max_segment_angle);
    return n < 1.0 ? 1 : static_cast<size_t>(n);
}

PathBuilder::PathBuilder(const Point2D& start, double max_segment_angle)
    : points_{start}, max_segment_angle_(max_segment_angle) {
    require_positive("max_segment_angle", max_segment_angle);
}

void PathBuilder::ensure_building() const {
    if (finalized_) {
        throw std::logic_error("PathBuilder already finalized");
    }
}

PathBuilder& PathBuilder::append_line(double length, double angle) {
    ensure_building();
    points_.push_back(current_point() + direction(angle) * length);
    return *this;
}

PathBuilder& PathBuilder::append_arc(double sweep, double angle, double radius) {
    return append_arc(sweep, angle, radius, max_segment_angle_);
}

PathBuilder& PathBuilder::append_arc(double sweep, double angle, double radius,
                                     double max_segment_angle) {
    ensure_building();
    require_finite("sweep", sweep);
    require_finite("angle", angle);
    require_finite("radius", radius);
    require_non_negative("radius", radius);
    require_positive("max_segment_angle", max_segment_angle);

    if (sweep == 0.0 || radius == 0.0) {
        return *this;
    }

    // Centre lies to the left of the tangent for counter-clockwise sweeps
    Point2D start = current_point();
    double side = sweep > 0.0 ? 1.0 : -1.0;
    Vec2 normal = direction(angle + 90.0);
    Point2D center = start + normal * (side * radius);
    Vec2 radial = start - center;

    size_t n = arc_segment_count(sweep, max_segment_angle);
    double step = sweep / static_cast<double>(n);
    for (size_t k = 1; k <= n; ++k) {
        points_.push_back(center + radial.rotated(step * static_cast<double>(k)));
    }
    return *this;
}

Ring PathBuilder::close_ring() {
    ensure_building();
    finalized_ = true;

    if (points_.size() < 3) {
        throw InvalidPolygonError("at least 3 points required");
    }

    Ring r = ring::remove_duplicates(points_);
    if (r.size() < 3) {
        throw InvalidPolygonError("at least 3 points required");
    }
    if (!ring::is_simple(r)) {
        logging::get_logger()->debug("PathBuilder: self-intersecting ring with {} points", r.size());
        throw InvalidPolygonError("constructed polygon is not valid");
    }
    return r;
}

ClosedPolygon PathBuilder::generate_polygon(bool transform_centroid) {
    ClosedPolygon polygon(close_ring());
    if (transform_centroid) {
        return polygon.translated(-polygon.centroid());
    }
    return polygon;
}

}  // namespace sectionpath
