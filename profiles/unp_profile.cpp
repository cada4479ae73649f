#include "unp_profile.hpp"
#include "angles.hpp"
#include "path_builder.hpp"
#include "validation.hpp"
#include <algorithm>
#include <cmath>

namespace sectionpath {

UNPFlangeGeometry UNPFlangeGeometry::compute(double flange_width, double flange_thickness,
                                             double web_thickness, double total_height,
                                             double root_fillet_radius, double toe_radius,
                                             double slope) {
    UNPFlangeGeometry g;
    g.slope_angle = slope_to_angle(slope);
    double a = deg_to_rad(g.slope_angle);

    g.root_fillet_height = std::cos(a) * root_fillet_radius;
    g.root_fillet_width = (1.0 - std::sin(a)) * root_fillet_radius;
    g.toe_radius_height = std::cos(a) * toe_radius;
    g.toe_radius_width = (1.0 - std::sin(a)) * toe_radius;

    g.slope_width = flange_width - web_thickness - g.root_fillet_width - g.toe_radius_width;
    g.slope_height = std::tan(a) * g.slope_width;
    g.slope_length = std::hypot(g.slope_width, g.slope_height);

    g.toe_total_height = flange_thickness - (flange_width / 2.0 - g.toe_radius_width) * slope / 100.0;
    g.toe_flat_height = g.toe_total_height - g.toe_radius_height;
    g.web_inner_height = total_height / 2.0 - g.toe_total_height - g.slope_height - g.root_fillet_height;
    return g;
}

void UNPFlangeGeometry::validate(const std::string& side) const {
    require_non_negative(side + "_root_fillet_height", root_fillet_height);
    require_non_negative(side + "_root_fillet_width", root_fillet_width);
    require_non_negative(side + "_toe_radius_height", toe_radius_height);
    require_non_negative(side + "_toe_radius_width", toe_radius_width);
    require_non_negative(side + "_slope_width", slope_width);
    require_non_negative(side + "_slope_height", slope_height);
    require_non_negative(side + "_slope_length", slope_length);
    require_non_negative(side + "_toe_total_height", toe_total_height);
    require_non_negative(side + "_toe_flat_height", toe_flat_height);
    require_non_negative("web_inner_height_" + side, web_inner_height);
}

double UNPFlangeGeometry::edge_thickness(double flange_width, double flange_thickness,
                                         double slope) {
    return flange_thickness - flange_width / 2.0 * slope / 100.0;
}

double UNPFlangeGeometry::max_toe_radius(double flange_width, double flange_thickness,
                                         double slope) {
    // toe_flat_height = edge_thickness - r * (1 - sin a) / cos a
    double a = deg_to_rad(slope_to_angle(slope));
    double per_radius = (1.0 - std::sin(a)) / std::cos(a);
    double limit = edge_thickness(flange_width, flange_thickness, slope) / per_radius;
    return std::max(limit - GEOMETRY_TOLERANCE, 0.0);
}

UNPProfile::UNPProfile(const UNPDimensions& dimensions, std::string name,
                       const Placement& placement)
    : Profile(std::move(name), placement), dimensions_(dimensions) {
    const auto& d = dimensions_;
    require_non_negative({
        {"top_flange_total_width", d.top_flange_total_width},
        {"top_flange_thickness", d.top_flange_thickness},
        {"bottom_flange_total_width", d.bottom_flange_total_width},
        {"bottom_flange_thickness", d.bottom_flange_thickness},
        {"total_height", d.total_height},
        {"web_thickness", d.web_thickness},
        {"top_root_fillet_radius", d.top_root_fillet_radius},
        {"top_toe_radius", d.top_toe_radius},
        {"top_outer_corner_radius", d.top_outer_corner_radius},
        {"bottom_root_fillet_radius", d.bottom_root_fillet_radius},
        {"bottom_toe_radius", d.bottom_toe_radius},
        {"bottom_outer_corner_radius", d.bottom_outer_corner_radius},
        {"top_slope", d.top_slope},
        {"bottom_slope", d.bottom_slope}
    });
    if (d.top_slope >= 100.0 || d.bottom_slope >= 100.0) {
        throw ValidationError("All slopes must be less than 100%");
    }

    top_ = UNPFlangeGeometry::compute(d.top_flange_total_width, d.top_flange_thickness,
                                      d.web_thickness, d.total_height,
                                      d.top_root_fillet_radius, d.top_toe_radius, d.top_slope);
    bottom_ = UNPFlangeGeometry::compute(d.bottom_flange_total_width, d.bottom_flange_thickness,
                                         d.web_thickness, d.total_height,
                                         d.bottom_root_fillet_radius, d.bottom_toe_radius,
                                         d.bottom_slope);
    top_.validate("top");
    bottom_.validate("bottom");

    // Outer flange faces must leave room for the corner radii
    require_non_negative("top_outer_straight_height", d.total_height / 2.0 - d.top_outer_corner_radius);
    require_non_negative("bottom_outer_straight_height", d.total_height / 2.0 - d.bottom_outer_corner_radius);
    require_non_negative("top_outer_straight_width", d.top_flange_total_width - d.top_outer_corner_radius);
    require_non_negative("bottom_outer_straight_width", d.bottom_flange_total_width - d.bottom_outer_corner_radius);

    set_geometry(compose());
}

double UNPProfile::max_profile_thickness() const {
    return std::max({dimensions_.top_flange_thickness, dimensions_.bottom_flange_thickness,
                     dimensions_.web_thickness});
}

ClosedPolygon UNPProfile::compose() const {
    const auto& d = dimensions_;
    double a_top = top_.slope_angle;
    double a_bot = bottom_.slope_angle;

    // Clockwise from mid-height of the web back
    return PathBuilder({0.0, 0.0})
        .append_line(d.total_height / 2.0 - d.top_outer_corner_radius, 90.0)
        // Top flange
        .append_arc(-90.0, 90.0, d.top_outer_corner_radius)
        .append_line(d.top_flange_total_width - d.top_outer_corner_radius, 0.0)
        .append_line(top_.toe_flat_height, 270.0)
        .append_arc(-90.0 + a_top, 270.0, d.top_toe_radius)
        .append_line(top_.slope_length, 180.0 + a_top)
        .append_arc(90.0 - a_top, 180.0 + a_top, d.top_root_fillet_radius)
        // Inner face of the web
        .append_line(top_.web_inner_height, 270.0)
        .append_line(bottom_.web_inner_height, 270.0)
        // Bottom flange
        .append_arc(90.0 - a_bot, 270.0, d.bottom_root_fillet_radius)
        .append_line(bottom_.slope_length, -a_bot)
        .append_arc(-90.0 + a_bot, -a_bot, d.bottom_toe_radius)
        .append_line(bottom_.toe_flat_height, 270.0)
        .append_line(d.bottom_flange_total_width - d.bottom_outer_corner_radius, 180.0)
        .append_arc(-90.0, 180.0, d.bottom_outer_corner_radius)
        .append_line(d.total_height / 2.0 - d.bottom_outer_corner_radius, 90.0)
        .generate_polygon();
}

std::shared_ptr<const Profile> UNPProfile::with_placement(const Placement& placement) const {
    return std::make_shared<UNPProfile>(dimensions_, name(), placement);
}

}  // namespace sectionpath
