#include "strip_profile.hpp"
#include "path_builder.hpp"
#include "validation.hpp"
#include <algorithm>

namespace sectionpath {

StripProfile::StripProfile(const StripDimensions& dimensions, std::string name,
                           const Placement& placement)
    : Profile(std::move(name), placement), dimensions_(dimensions) {
    require_positive("width", dimensions_.width);
    require_positive("height", dimensions_.height);

    set_geometry(PathBuilder({0.0, 0.0})
        .append_line(dimensions_.width, 0.0)
        .append_line(dimensions_.height, 90.0)
        .append_line(dimensions_.width, 180.0)
        .generate_polygon());
}

double StripProfile::max_profile_thickness() const {
    return std::min(dimensions_.width, dimensions_.height);
}

std::shared_ptr<const Profile> StripProfile::with_placement(const Placement& placement) const {
    return std::make_shared<StripProfile>(dimensions_, name(), placement);
}

}  // namespace sectionpath
