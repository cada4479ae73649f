#ifndef SECTIONPATH_PROFILES_UNP_PROFILE_HPP
#define SECTIONPATH_PROFILES_UNP_PROFILE_HPP

#include "profile.hpp"

namespace sectionpath {

// Channel section with sloped inner flange faces. Slopes are grades in
// percent; flange thickness is measured at half the flange width.
struct UNPDimensions {
    double top_flange_total_width = 0.0;
    double top_flange_thickness = 0.0;
    double bottom_flange_total_width = 0.0;
    double bottom_flange_thickness = 0.0;
    double total_height = 0.0;
    double web_thickness = 0.0;
    double top_root_fillet_radius = 0.0;
    double top_toe_radius = 0.0;
    double top_outer_corner_radius = 0.0;
    double bottom_root_fillet_radius = 0.0;
    double bottom_toe_radius = 0.0;
    double bottom_outer_corner_radius = 0.0;
    double top_slope = 0.0;
    double bottom_slope = 0.0;
};

// Where the straight, sloped and filleted parts of one flange meet
struct UNPFlangeGeometry {
    double slope_angle = 0.0;  // degrees
    double root_fillet_height = 0.0;
    double root_fillet_width = 0.0;
    double toe_radius_height = 0.0;
    double toe_radius_width = 0.0;
    double slope_width = 0.0;
    double slope_height = 0.0;
    double slope_length = 0.0;
    double toe_total_height = 0.0;
    double toe_flat_height = 0.0;
    double web_inner_height = 0.0;

    static UNPFlangeGeometry compute(double flange_width, double flange_thickness,
                                     double web_thickness, double total_height,
                                     double root_fillet_radius, double toe_radius,
                                     double slope);

    // Throws NegativeValueError naming the first negative length, prefixed by side
    void validate(const std::string& side) const;

    // Flange thickness at the toe edge before any toe rounding
    static double edge_thickness(double flange_width, double flange_thickness, double slope);

    // Largest toe radius that still leaves a non-negative toe flat height
    static double max_toe_radius(double flange_width, double flange_thickness, double slope);
};

class UNPProfile : public Profile {
public:
    explicit UNPProfile(const UNPDimensions& dimensions,
                        std::string name = "UNP",
                        const Placement& placement = {});

    const UNPDimensions& dimensions() const { return dimensions_; }
    const UNPFlangeGeometry& top_flange() const { return top_; }
    const UNPFlangeGeometry& bottom_flange() const { return bottom_; }

    std::string family() const override { return "UNP"; }
    double max_profile_thickness() const override;
    std::shared_ptr<const Profile> with_placement(const Placement& placement) const override;

private:
    ClosedPolygon compose() const;

    UNPDimensions dimensions_;
    UNPFlangeGeometry top_;
    UNPFlangeGeometry bottom_;
};

}  // namespace sectionpath

#endif // SECTIONPATH_PROFILES_UNP_PROFILE_HPP
