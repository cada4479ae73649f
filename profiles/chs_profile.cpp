#include "chs_profile.hpp"
#include "path_builder.hpp"
#include "validation.hpp"
#include <algorithm>
#include <numbers>

namespace sectionpath {

CHSProfile::CHSProfile(const CHSDimensions& dimensions, std::string name,
                       const Placement& placement)
    : Profile(std::move(name), placement), dimensions_(dimensions) {
    require_positive("outer_diameter", dimensions_.outer_diameter);
    require_positive("wall_thickness", dimensions_.wall_thickness);
    require_non_negative("inner_diameter", dimensions_.inner_diameter());

    set_geometry(compose());
}

double CHSProfile::segment_angle() const {
    return std::min(PathBuilder::DEFAULT_MAX_SEGMENT_ANGLE,
                    360.0 / (std::numbers::pi * dimensions_.outer_diameter));
}

ClosedPolygon CHSProfile::compose() const {
    double r_out = dimensions_.outer_radius();
    double r_in = dimensions_.inner_radius();
    double seg = segment_angle();

    // Both rings start at the bottom of the circle so they share a centre
    Ring outer = PathBuilder({0.0, 0.0}, seg)
        .append_arc(360.0, 0.0, r_out)
        .close_ring();

    ClosedPolygon polygon;
    if (r_in > 0.0) {
        Ring inner = PathBuilder({0.0, r_out - r_in}, seg)
            .append_arc(360.0, 0.0, r_in)
            .close_ring();
        polygon = ClosedPolygon(std::move(outer), {std::move(inner)});
    } else {
        polygon = ClosedPolygon(std::move(outer));
    }
    return polygon.translated(-polygon.centroid());
}

std::shared_ptr<const Profile> CHSProfile::with_placement(const Placement& placement) const {
    return std::make_shared<CHSProfile>(dimensions_, name(), placement);
}

}  // namespace sectionpath
