#ifndef SECTIONPATH_PROFILES_CORNERED_PROFILE_HPP
#define SECTIONPATH_PROFILES_CORNERED_PROFILE_HPP

#include "profile.hpp"
#include <string>

namespace sectionpath {

// Square corner piece with a quarter-circle cut-out.
//
//         .---- outer arc
//         v
//     . . .+--------------------+
//     .  /                      |
//     ./                        |<-- thickness_vertical
//     +                         |
//     |                     _ _ |<-- inner arc
//     |                   /
//     |                  |
//     +------------------+<-- thickness_horizontal
//
// corner_direction: 0 = ↰, 1 = ↱, 2 = ↳, 3 = ↲
// reference_point: "intersection" keeps (x, y) at the construction origin,
// the centre of the inner arc for unsloped corners. "outer" shifts the piece
// by its total width and height so (x, y) is where a sharp outer corner
// would be.
struct CorneredDimensions {
    double thickness_vertical = 0.0;
    double thickness_horizontal = 0.0;
    double inner_radius = 0.0;
    double outer_radius = 0.0;
    int corner_direction = 0;
    double inner_slope_at_vertical = 0.0;
    double inner_slope_at_horizontal = 0.0;
    double outer_slope_at_vertical = 0.0;
    double outer_slope_at_horizontal = 0.0;
    std::string reference_point = "intersection";
    double x = 0.0;
    double y = 0.0;
};

class CorneredProfile : public Profile {
public:
    // Tessellation points per arc
    static constexpr int ARC_POINTS = 16;

    explicit CorneredProfile(const CorneredDimensions& dimensions,
                             std::string name = "Corner",
                             const Placement& placement = {});

    const CorneredDimensions& dimensions() const { return dimensions_; }

    // Extent of the piece before flipping, including any arc extension
    double total_width() const { return total_width_; }
    double total_height() const { return total_height_; }

    std::string family() const override { return "Cornered"; }
    double max_profile_thickness() const override;
    std::shared_ptr<const Profile> with_placement(const Placement& placement) const override;

private:
    ClosedPolygon compose();

    CorneredDimensions dimensions_;
    double total_width_ = 0.0;
    double total_height_ = 0.0;
};

}  // namespace sectionpath

#endif // SECTIONPATH_PROFILES_CORNERED_PROFILE_HPP
