#include "annular_sector_profile.hpp"
#include "path_builder.hpp"
#include "validation.hpp"
#include <spdlog/fmt/fmt.h>

namespace sectionpath {

AnnularSectorProfile::AnnularSectorProfile(const AnnularSectorDimensions& dimensions,
                                           std::string name, const Placement& placement)
    : Profile(std::move(name), placement), dimensions_(dimensions) {
    const auto& d = dimensions_;
    require_non_negative("inner_radius", d.inner_radius);
    require_positive("thickness", d.thickness);
    if (d.start_angle > 360.0 || d.start_angle < -360.0) {
        throw ValidationError(fmt::format(
            "Start angle must be between -360 and 360 degrees, but got {}", d.start_angle));
    }
    if (d.end_angle <= d.start_angle) {
        throw ValidationError(fmt::format(
            "End angle must be greater than start angle, but got end angle {} and start angle {}",
            d.end_angle, d.start_angle));
    }
    if (d.end_angle - d.start_angle >= 360.0) {
        throw ValidationError(fmt::format(
            "The total angle made between start and end angle must be less than 360 degrees, "
            "but got {} degrees (end {} - start {})",
            d.end_angle - d.start_angle, d.end_angle, d.start_angle));
    }

    set_geometry(compose());
}

ClosedPolygon AnnularSectorProfile::compose() const {
    const auto& d = dimensions_;
    double span = d.end_angle - d.start_angle;

    // Compass angles to counter-clockwise-from-x headings
    double phi_start = 90.0 - d.start_angle;
    double phi_end = 90.0 - d.end_angle;
    Point2D center{d.x, d.y};

    // Out along the start cut, clockwise along the outer arc, back in along
    // the end cut and counter-clockwise along the inner arc
    return PathBuilder(center + direction(phi_start) * d.inner_radius, SEGMENT_ANGLE)
        .append_line(d.thickness, phi_start)
        .append_arc(-span, phi_start - 90.0, d.outer_radius())
        .append_line(d.thickness, phi_end + 180.0)
        .append_arc(span, phi_end + 90.0, d.inner_radius)
        .generate_polygon(false);
}

std::shared_ptr<const Profile> AnnularSectorProfile::with_placement(const Placement& placement) const {
    return std::make_shared<AnnularSectorProfile>(dimensions_, name(), placement);
}

}  // namespace sectionpath
