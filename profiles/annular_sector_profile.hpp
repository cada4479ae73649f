#ifndef SECTIONPATH_PROFILES_ANNULAR_SECTOR_PROFILE_HPP
#define SECTIONPATH_PROFILES_ANNULAR_SECTOR_PROFILE_HPP

#include "profile.hpp"

namespace sectionpath {

// Part of a ring between two radial cuts. Angles are degrees measured from
// the +y axis, clockwise positive; (x, y) is the centre of the arcs.
struct AnnularSectorDimensions {
    double inner_radius = 0.0;
    double thickness = 0.0;
    double start_angle = 0.0;
    double end_angle = 0.0;
    double x = 0.0;
    double y = 0.0;

    double outer_radius() const { return inner_radius + thickness; }
    double radius_centerline() const { return inner_radius + thickness / 2.0; }
};

class AnnularSectorProfile : public Profile {
public:
    // 64 chords per quarter turn
    static constexpr double SEGMENT_ANGLE = 90.0 / 64.0;

    explicit AnnularSectorProfile(const AnnularSectorDimensions& dimensions,
                                  std::string name = "Annular Sector",
                                  const Placement& placement = {});

    const AnnularSectorDimensions& dimensions() const { return dimensions_; }

    std::string family() const override { return "AnnularSector"; }
    double max_profile_thickness() const override { return dimensions_.thickness; }
    std::shared_ptr<const Profile> with_placement(const Placement& placement) const override;

private:
    ClosedPolygon compose() const;

    AnnularSectorDimensions dimensions_;
};

}  // namespace sectionpath

#endif // SECTIONPATH_PROFILES_ANNULAR_SECTOR_PROFILE_HPP
