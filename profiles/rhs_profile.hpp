#ifndef SECTIONPATH_PROFILES_RHS_PROFILE_HPP
#define SECTIONPATH_PROFILES_RHS_PROFILE_HPP

#include "profile.hpp"

namespace sectionpath {

// Rectangular (or square) hollow section with independent walls and corners
struct RHSDimensions {
    double total_width = 0.0;
    double total_height = 0.0;
    double left_wall_thickness = 0.0;
    double right_wall_thickness = 0.0;
    double top_wall_thickness = 0.0;
    double bottom_wall_thickness = 0.0;
    double top_right_outer_radius = 0.0;
    double top_left_outer_radius = 0.0;
    double bottom_right_outer_radius = 0.0;
    double bottom_left_outer_radius = 0.0;
    double top_right_inner_radius = 0.0;
    double top_left_inner_radius = 0.0;
    double bottom_right_inner_radius = 0.0;
    double bottom_left_inner_radius = 0.0;

    // Same wall thickness and corner radii on all four sides
    static RHSDimensions uniform(double total_width, double total_height,
                                 double thickness, double outer_radius,
                                 double inner_radius);
};

// Straight lengths between the corner arcs
struct RHSWallLengths {
    double right_outer_height = 0.0;
    double left_outer_height = 0.0;
    double top_outer_width = 0.0;
    double bottom_outer_width = 0.0;
    double right_inner_height = 0.0;
    double left_inner_height = 0.0;
    double top_inner_width = 0.0;
    double bottom_inner_width = 0.0;

    static RHSWallLengths from_dimensions(const RHSDimensions& d);
};

class RHSProfile : public Profile {
public:
    explicit RHSProfile(const RHSDimensions& dimensions,
                        std::string name = "RHS",
                        const Placement& placement = {});

    const RHSDimensions& dimensions() const { return dimensions_; }
    const RHSWallLengths& walls() const { return walls_; }

    std::string family() const override { return "RHS"; }
    double max_profile_thickness() const override;
    std::shared_ptr<const Profile> with_placement(const Placement& placement) const override;

private:
    ClosedPolygon compose() const;

    RHSDimensions dimensions_;
    RHSWallLengths walls_;
};

}  // namespace sectionpath

#endif // SECTIONPATH_PROFILES_RHS_PROFILE_HPP
