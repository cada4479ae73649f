#ifndef SECTIONPATH_PROFILES_LNP_PROFILE_HPP
#define SECTIONPATH_PROFILES_LNP_PROFILE_HPP

#include "profile.hpp"

namespace sectionpath {

// Angle section. The web is the vertical leg, the base the horizontal leg.
struct LNPDimensions {
    double total_height = 0.0;
    double total_width = 0.0;
    double web_thickness = 0.0;
    double base_thickness = 0.0;
    double root_radius = 0.0;
    double back_radius = 0.0;
    double web_toe_radius = 0.0;
    double base_toe_radius = 0.0;
};

class LNPProfile : public Profile {
public:
    explicit LNPProfile(const LNPDimensions& dimensions,
                        std::string name = "LNP",
                        const Placement& placement = {});

    const LNPDimensions& dimensions() const { return dimensions_; }

    std::string family() const override { return "LNP"; }
    double max_profile_thickness() const override;
    std::shared_ptr<const Profile> with_placement(const Placement& placement) const override;

    double web_toe_straight_part() const { return web_toe_straight_part_; }
    double base_toe_straight_part() const { return base_toe_straight_part_; }
    double web_outer_height() const { return web_outer_height_; }
    double web_inner_height() const { return web_inner_height_; }
    double base_outer_width() const { return base_outer_width_; }
    double base_inner_width() const { return base_inner_width_; }

private:
    ClosedPolygon compose() const;

    LNPDimensions dimensions_;
    double web_toe_straight_part_ = 0.0;
    double base_toe_straight_part_ = 0.0;
    double web_outer_height_ = 0.0;
    double web_inner_height_ = 0.0;
    double base_outer_width_ = 0.0;
    double base_inner_width_ = 0.0;
};

}  // namespace sectionpath

#endif // SECTIONPATH_PROFILES_LNP_PROFILE_HPP
