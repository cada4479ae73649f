#ifndef SECTIONPATH_PROFILES_CHS_PROFILE_HPP
#define SECTIONPATH_PROFILES_CHS_PROFILE_HPP

#include "profile.hpp"

namespace sectionpath {

// Circular hollow section
struct CHSDimensions {
    double outer_diameter = 0.0;
    double wall_thickness = 0.0;

    double outer_radius() const { return outer_diameter / 2.0; }
    double inner_diameter() const { return outer_diameter - 2.0 * wall_thickness; }
    double inner_radius() const { return inner_diameter() / 2.0; }
};

class CHSProfile : public Profile {
public:
    explicit CHSProfile(const CHSDimensions& dimensions,
                        std::string name = "CHS",
                        const Placement& placement = {});

    const CHSDimensions& dimensions() const { return dimensions_; }

    std::string family() const override { return "CHS"; }
    double max_profile_thickness() const override { return dimensions_.wall_thickness; }
    std::shared_ptr<const Profile> with_placement(const Placement& placement) const override;

    // Chord angle keeping chords near 1 mm on large tubes
    double segment_angle() const;

private:
    ClosedPolygon compose() const;

    CHSDimensions dimensions_;
};

}  // namespace sectionpath

#endif // SECTIONPATH_PROFILES_CHS_PROFILE_HPP
