#ifndef SECTIONPATH_PROFILES_I_PROFILE_HPP
#define SECTIONPATH_PROFILES_I_PROFILE_HPP

#include "profile.hpp"

namespace sectionpath {

// I (double-T) section with parallel flanges centred on the web
struct IDimensions {
    double top_flange_width = 0.0;
    double top_flange_thickness = 0.0;
    double bottom_flange_width = 0.0;
    double bottom_flange_thickness = 0.0;
    double total_height = 0.0;
    double web_thickness = 0.0;
    double top_radius = 0.0;
    double bottom_radius = 0.0;
};

class IProfile : public Profile {
public:
    explicit IProfile(const IDimensions& dimensions,
                      std::string name = "I-Profile",
                      const Placement& placement = {});

    const IDimensions& dimensions() const { return dimensions_; }

    double web_height() const { return web_height_; }
    double width_outstand_top_flange() const { return outstand_top_; }
    double width_outstand_bottom_flange() const { return outstand_bottom_; }

    std::string family() const override { return "I"; }
    double max_profile_thickness() const override;
    std::shared_ptr<const Profile> with_placement(const Placement& placement) const override;

private:
    ClosedPolygon compose() const;

    IDimensions dimensions_;
    double web_height_ = 0.0;
    double outstand_top_ = 0.0;
    double outstand_bottom_ = 0.0;
};

}  // namespace sectionpath

#endif // SECTIONPATH_PROFILES_I_PROFILE_HPP
