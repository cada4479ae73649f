#include "lnp_profile.hpp"
#include "path_builder.hpp"
#include "validation.hpp"
#include <algorithm>

namespace sectionpath {

LNPProfile::LNPProfile(const LNPDimensions& dimensions, std::string name,
                       const Placement& placement)
    : Profile(std::move(name), placement), dimensions_(dimensions) {
    const auto& d = dimensions_;
    require_non_negative({
        {"total_height", d.total_height},
        {"total_width", d.total_width},
        {"web_thickness", d.web_thickness},
        {"base_thickness", d.base_thickness},
        {"root_radius", d.root_radius},
        {"back_radius", d.back_radius},
        {"web_toe_radius", d.web_toe_radius},
        {"base_toe_radius", d.base_toe_radius}
    });

    web_toe_straight_part_ = d.web_thickness - d.web_toe_radius;
    base_toe_straight_part_ = d.base_thickness - d.base_toe_radius;
    web_outer_height_ = d.total_height - d.back_radius;
    web_inner_height_ = d.total_height - d.base_thickness - d.root_radius - d.web_toe_radius;
    base_outer_width_ = d.total_width - d.back_radius;
    base_inner_width_ = d.total_width - d.web_thickness - d.root_radius - d.base_toe_radius;

    require_non_negative({
        {"web_toe_straight_part", web_toe_straight_part_},
        {"base_toe_straight_part", base_toe_straight_part_},
        {"web_outer_height", web_outer_height_},
        {"web_inner_height", web_inner_height_},
        {"base_outer_width", base_outer_width_},
        {"base_inner_width", base_inner_width_}
    });

    set_geometry(compose());
}

double LNPProfile::max_profile_thickness() const {
    return std::max(dimensions_.web_thickness, dimensions_.base_thickness);
}

ClosedPolygon LNPProfile::compose() const {
    const auto& d = dimensions_;

    // Clockwise from the top-left corner of the web
    return PathBuilder({0.0, 0.0})
        .append_line(web_toe_straight_part_, 0.0)
        .append_arc(-90.0, 0.0, d.web_toe_radius)
        .append_line(web_inner_height_, 270.0)
        .append_arc(90.0, 270.0, d.root_radius)
        .append_line(base_inner_width_, 0.0)
        .append_arc(-90.0, 0.0, d.base_toe_radius)
        .append_line(base_toe_straight_part_, 270.0)
        .append_line(base_outer_width_, 180.0)
        .append_arc(-90.0, 180.0, d.back_radius)
        .append_line(web_outer_height_, 90.0)
        .generate_polygon();
}

std::shared_ptr<const Profile> LNPProfile::with_placement(const Placement& placement) const {
    return std::make_shared<LNPProfile>(dimensions_, name(), placement);
}

}  // namespace sectionpath
