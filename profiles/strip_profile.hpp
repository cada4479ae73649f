#ifndef SECTIONPATH_PROFILES_STRIP_PROFILE_HPP
#define SECTIONPATH_PROFILES_STRIP_PROFILE_HPP

#include "profile.hpp"

namespace sectionpath {

// Flat bar; height is the plate thickness for catalog strips
struct StripDimensions {
    double width = 0.0;
    double height = 0.0;
};

class StripProfile : public Profile {
public:
    explicit StripProfile(const StripDimensions& dimensions,
                          std::string name = "Strip",
                          const Placement& placement = {});

    const StripDimensions& dimensions() const { return dimensions_; }

    std::string family() const override { return "Strip"; }
    double max_profile_thickness() const override;
    std::shared_ptr<const Profile> with_placement(const Placement& placement) const override;

private:
    StripDimensions dimensions_;
};

}  // namespace sectionpath

#endif // SECTIONPATH_PROFILES_STRIP_PROFILE_HPP
