#include "rhs_profile.hpp"
#include "path_builder.hpp"
#include "validation.hpp"
#include <algorithm>

namespace sectionpath {

RHSDimensions RHSDimensions::uniform(double total_width, double total_height,
                                     double thickness, double outer_radius,
                                     double inner_radius) {
    return RHSDimensions{
        .total_width = total_width,
        .total_height = total_height,
        .left_wall_thickness = thickness,
        .right_wall_thickness = thickness,
        .top_wall_thickness = thickness,
        .bottom_wall_thickness = thickness,
        .top_right_outer_radius = outer_radius,
        .top_left_outer_radius = outer_radius,
        .bottom_right_outer_radius = outer_radius,
        .bottom_left_outer_radius = outer_radius,
        .top_right_inner_radius = inner_radius,
        .top_left_inner_radius = inner_radius,
        .bottom_right_inner_radius = inner_radius,
        .bottom_left_inner_radius = inner_radius
    };
}

RHSWallLengths RHSWallLengths::from_dimensions(const RHSDimensions& d) {
    double inner_height = d.total_height - d.top_wall_thickness - d.bottom_wall_thickness;
    double inner_width = d.total_width - d.left_wall_thickness - d.right_wall_thickness;
    return RHSWallLengths{
        .right_outer_height = d.total_height - d.top_right_outer_radius - d.bottom_right_outer_radius,
        .left_outer_height = d.total_height - d.top_left_outer_radius - d.bottom_left_outer_radius,
        .top_outer_width = d.total_width - d.top_right_outer_radius - d.top_left_outer_radius,
        .bottom_outer_width = d.total_width - d.bottom_right_outer_radius - d.bottom_left_outer_radius,
        .right_inner_height = inner_height - d.top_right_inner_radius - d.bottom_right_inner_radius,
        .left_inner_height = inner_height - d.top_left_inner_radius - d.bottom_left_inner_radius,
        .top_inner_width = inner_width - d.top_right_inner_radius - d.top_left_inner_radius,
        .bottom_inner_width = inner_width - d.bottom_right_inner_radius - d.bottom_left_inner_radius
    };
}

RHSProfile::RHSProfile(const RHSDimensions& dimensions, std::string name,
                       const Placement& placement)
    : Profile(std::move(name), placement), dimensions_(dimensions) {
    const auto& d = dimensions_;
    require_non_negative({
        {"total_width", d.total_width},
        {"total_height", d.total_height},
        {"left_wall_thickness", d.left_wall_thickness},
        {"right_wall_thickness", d.right_wall_thickness},
        {"top_wall_thickness", d.top_wall_thickness},
        {"bottom_wall_thickness", d.bottom_wall_thickness},
        {"top_right_outer_radius", d.top_right_outer_radius},
        {"top_left_outer_radius", d.top_left_outer_radius},
        {"bottom_right_outer_radius", d.bottom_right_outer_radius},
        {"bottom_left_outer_radius", d.bottom_left_outer_radius},
        {"top_right_inner_radius", d.top_right_inner_radius},
        {"top_left_inner_radius", d.top_left_inner_radius},
        {"bottom_right_inner_radius", d.bottom_right_inner_radius},
        {"bottom_left_inner_radius", d.bottom_left_inner_radius}
    });

    walls_ = RHSWallLengths::from_dimensions(d);
    require_non_negative({
        {"right_wall_outer_height", walls_.right_outer_height},
        {"left_wall_outer_height", walls_.left_outer_height},
        {"top_wall_outer_width", walls_.top_outer_width},
        {"bottom_wall_outer_width", walls_.bottom_outer_width},
        {"right_wall_inner_height", walls_.right_inner_height},
        {"left_wall_inner_height", walls_.left_inner_height},
        {"top_wall_inner_width", walls_.top_inner_width},
        {"bottom_wall_inner_width", walls_.bottom_inner_width}
    });

    set_geometry(compose());
}

double RHSProfile::max_profile_thickness() const {
    return std::max({dimensions_.left_wall_thickness, dimensions_.right_wall_thickness,
                     dimensions_.top_wall_thickness, dimensions_.bottom_wall_thickness});
}

ClosedPolygon RHSProfile::compose() const {
    const auto& d = dimensions_;
    const auto& w = walls_;

    // Clockwise from just right of the top-left outer corner
    Ring outer = PathBuilder({0.0, 0.0})
        .append_line(w.top_outer_width, 0.0)
        .append_arc(-90.0, 0.0, d.top_right_outer_radius)
        .append_line(w.right_outer_height, 270.0)
        .append_arc(-90.0, 270.0, d.bottom_right_outer_radius)
        .append_line(w.bottom_outer_width, 180.0)
        .append_arc(-90.0, 180.0, d.bottom_left_outer_radius)
        .append_line(w.left_outer_height, 90.0)
        .append_arc(-90.0, 90.0, d.top_left_outer_radius)
        .close_ring();

    // Same corner of the cavity, in the same frame
    Point2D inner_start{
        d.left_wall_thickness + d.top_left_inner_radius - d.top_left_outer_radius,
        -d.top_wall_thickness
    };
    Ring inner = PathBuilder(inner_start)
        .append_line(w.top_inner_width, 0.0)
        .append_arc(-90.0, 0.0, d.top_right_inner_radius)
        .append_line(w.right_inner_height, 270.0)
        .append_arc(-90.0, 270.0, d.bottom_right_inner_radius)
        .append_line(w.bottom_inner_width, 180.0)
        .append_arc(-90.0, 180.0, d.bottom_left_inner_radius)
        .append_line(w.left_inner_height, 90.0)
        .append_arc(-90.0, 90.0, d.top_left_inner_radius)
        .close_ring();

    ClosedPolygon polygon(std::move(outer), {std::move(inner)});
    return polygon.translated(-polygon.centroid());
}

std::shared_ptr<const Profile> RHSProfile::with_placement(const Placement& placement) const {
    return std::make_shared<RHSProfile>(dimensions_, name(), placement);
}

}  // namespace sectionpath
