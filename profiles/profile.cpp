#include "profile.hpp"
#include "logging.hpp"

namespace sectionpath {

Profile::Profile(std::string name, const Placement& placement)
    : name_(std::move(name)), placement_(placement) {}

void Profile::set_geometry(ClosedPolygon local) {
    local_ = std::move(local);
    placed_ = local_
        .rotated(placement_.rotation, local_.centroid())
        .translated({placement_.horizontal_offset, placement_.vertical_offset});

    logging::get_logger()->debug("Profile '{}': {} vertices, area={:.3f}",
                                 name_, placed_.vertex_count(), placed_.area());
}

std::shared_ptr<const Profile> Profile::transform(double horizontal_offset,
                                                  double vertical_offset,
                                                  double rotation) const {
    Placement next{
        .horizontal_offset = placement_.horizontal_offset + horizontal_offset,
        .vertical_offset = placement_.vertical_offset + vertical_offset,
        .rotation = placement_.rotation + rotation
    };
    return with_placement(next);
}

}  // namespace sectionpath
