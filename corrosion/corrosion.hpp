#ifndef SECTIONPATH_CORROSION_CORROSION_HPP
#define SECTIONPATH_CORROSION_CORROSION_HPP

#include "profiles.hpp"
#include <memory>
#include <optional>
#include <string>

namespace sectionpath {

// Thicknesses at or below this after corrosion count as fully corroded (mm)
constexpr double FULL_CORROSION_TOLERANCE = 1e-3;

// Loss per exposed face for profiles corroding on every surface (mm)
struct UniformCorrosion {
    double corrosion = 0.0;
};

// Separate loss on the outer and cavity faces of hollow sections (mm)
struct HollowCorrosion {
    double outside = 0.0;
    double inside = 0.0;
};

namespace corrosion {

// Recorded corrosion parsed back out of a profile name
struct NameAnnotation {
    std::string base_name;
    std::optional<double> uniform;
    std::optional<HollowCorrosion> hollow;
};

NameAnnotation parse_name(const std::string& name);

// Appends the loss to the name, summing with any loss already recorded:
//   "IPE200"                      + 1.5 -> "IPE200 (corrosion: 1.5 mm)"
//   "IPE200 (corrosion: 1.5 mm)"  + 0.5 -> "IPE200 (corrosion: 2.0 mm)"
std::string update_name(const std::string& name, const UniformCorrosion& loss);

//   "RHS200x100x5" + {outside 2, inside 1}
//     -> "RHS200x100x5 (corrosion inside: 1.0 mm, outside: 2.0 mm)"
std::string update_name(const std::string& name, const HollowCorrosion& loss);

// Shortest round-trip decimal that always carries a fractional part
std::string format_mm(double value);

}  // namespace corrosion

// Each overload returns a new, smaller profile with the source placement,
// or the same instance when the loss is zero. Throws NegativeValueError for
// negative losses and FullyCorrodedError when a thickness drops to the
// tolerance. Convex radii are capped at what the thinned plates can hold,
// so toes and corners never make a loss below the thinnest plate infeasible.
std::shared_ptr<const CHSProfile> with_corrosion(
    const std::shared_ptr<const CHSProfile>& profile, const HollowCorrosion& loss);

std::shared_ptr<const RHSProfile> with_corrosion(
    const std::shared_ptr<const RHSProfile>& profile, const HollowCorrosion& loss);

std::shared_ptr<const LNPProfile> with_corrosion(
    const std::shared_ptr<const LNPProfile>& profile, const UniformCorrosion& loss);

std::shared_ptr<const UNPProfile> with_corrosion(
    const std::shared_ptr<const UNPProfile>& profile, const UniformCorrosion& loss);

std::shared_ptr<const StripProfile> with_corrosion(
    const std::shared_ptr<const StripProfile>& profile, const UniformCorrosion& loss);

std::shared_ptr<const IProfile> with_corrosion(
    const std::shared_ptr<const IProfile>& profile, const UniformCorrosion& loss);

// Dispatches on the dynamic family. Single-surface families take `outside`
// as their uniform loss and reject a non-zero `inside`; families without a
// corrosion model accept only a zero loss.
std::shared_ptr<const Profile> with_corrosion(
    const std::shared_ptr<const Profile>& profile, const HollowCorrosion& loss);

}  // namespace sectionpath

#endif // SECTIONPATH_CORROSION_CORROSION_HPP
