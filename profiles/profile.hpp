#ifndef SECTIONPATH_PROFILES_PROFILE_HPP
#define SECTIONPATH_PROFILES_PROFILE_HPP

#include "vec2.hpp"
#include "polygon.hpp"
#include <memory>
#include <string>

namespace sectionpath {

// Rigid placement applied after the profile is composed. Rotation is in
// degrees, counter-clockwise about the profile centroid, and is applied
// before the offsets.
struct Placement {
    double horizontal_offset = 0.0;
    double vertical_offset = 0.0;
    double rotation = 0.0;
};

// Base of every cross-section family. Instances are immutable; all
// dimensions are validated and the boundary is composed in the constructor.
class Profile {
public:
    virtual ~Profile() = default;

    Profile(const Profile&) = delete;
    Profile& operator=(const Profile&) = delete;

    const std::string& name() const { return name_; }
    const Placement& placement() const { return placement_; }

    virtual std::string family() const = 0;

    // Thickest plate element of the profile (mm)
    virtual double max_profile_thickness() const = 0;

    // Composer output before placement
    const ClosedPolygon& local_polygon() const { return local_; }

    // Composer output after placement
    const ClosedPolygon& polygon() const { return placed_; }

    double area() const { return placed_.area(); }
    double perimeter() const { return placed_.perimeter(); }
    Point2D centroid() const { return placed_.centroid(); }
    double profile_width() const { return placed_.bounds().width(); }
    double profile_height() const { return placed_.bounds().height(); }

    // Steel volume per metre of member length (m^3/m)
    double volume_per_meter() const { return area() * 1e-6; }

    // New profile with this one's placement extended by the given move
    std::shared_ptr<const Profile> transform(double horizontal_offset,
                                             double vertical_offset,
                                             double rotation = 0.0) const;

    virtual std::shared_ptr<const Profile> with_placement(const Placement& placement) const = 0;

protected:
    Profile(std::string name, const Placement& placement);

    // Called once by the family constructor after validation
    void set_geometry(ClosedPolygon local);

private:
    std::string name_;
    Placement placement_;
    ClosedPolygon local_;
    ClosedPolygon placed_;
};

}  // namespace sectionpath

#endif // SECTIONPATH_PROFILES_PROFILE_HPP
