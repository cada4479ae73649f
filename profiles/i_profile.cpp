#include "i_profile.hpp"
#include "path_builder.hpp"
#include "validation.hpp"
#include <algorithm>

namespace sectionpath {

IProfile::IProfile(const IDimensions& dimensions, std::string name,
                   const Placement& placement)
    : Profile(std::move(name), placement), dimensions_(dimensions) {
    const auto& d = dimensions_;
    require_non_negative({
        {"top_flange_width", d.top_flange_width},
        {"top_flange_thickness", d.top_flange_thickness},
        {"bottom_flange_width", d.bottom_flange_width},
        {"bottom_flange_thickness", d.bottom_flange_thickness},
        {"total_height", d.total_height},
        {"web_thickness", d.web_thickness},
        {"top_radius", d.top_radius},
        {"bottom_radius", d.bottom_radius}
    });

    web_height_ = d.total_height - d.top_flange_thickness - d.bottom_flange_thickness
        - d.top_radius - d.bottom_radius;
    outstand_top_ = (d.top_flange_width - d.web_thickness - 2.0 * d.top_radius) / 2.0;
    outstand_bottom_ = (d.bottom_flange_width - d.web_thickness - 2.0 * d.bottom_radius) / 2.0;
    require_non_negative({
        {"web_height", web_height_},
        {"width_outstand_top_flange", outstand_top_},
        {"width_outstand_bottom_flange", outstand_bottom_}
    });

    set_geometry(compose());
}

double IProfile::max_profile_thickness() const {
    return std::max({dimensions_.top_flange_thickness, dimensions_.bottom_flange_thickness,
                     dimensions_.web_thickness});
}

ClosedPolygon IProfile::compose() const {
    const auto& d = dimensions_;

    // Clockwise from the top-left corner of the top flange
    return PathBuilder({0.0, 0.0})
        .append_line(d.top_flange_width, 0.0)
        .append_line(d.top_flange_thickness, 270.0)
        .append_line(outstand_top_, 180.0)
        .append_arc(90.0, 180.0, d.top_radius)
        .append_line(web_height_, 270.0)
        .append_arc(90.0, 270.0, d.bottom_radius)
        .append_line(outstand_bottom_, 0.0)
        .append_line(d.bottom_flange_thickness, 270.0)
        .append_line(d.bottom_flange_width, 180.0)
        .append_line(d.bottom_flange_thickness, 90.0)
        .append_line(outstand_bottom_, 0.0)
        .append_arc(90.0, 0.0, d.bottom_radius)
        .append_line(web_height_, 90.0)
        .append_arc(90.0, 90.0, d.top_radius)
        .append_line(outstand_top_, 180.0)
        .append_line(d.top_flange_thickness, 90.0)
        .generate_polygon();
}

std::shared_ptr<const Profile> IProfile::with_placement(const Placement& placement) const {
    return std::make_shared<IProfile>(dimensions_, name(), placement);
}

}  // namespace sectionpath
