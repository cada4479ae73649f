#ifndef SECTIONPATH_MATH_ANGLES_HPP
#define SECTIONPATH_MATH_ANGLES_HPP

#include <cmath>
#include <numbers>

namespace sectionpath {

constexpr double deg_to_rad(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}

constexpr double rad_to_deg(double radians) {
    return radians * 180.0 / std::numbers::pi;
}

// Converts a grade in percent (rise over run * 100) to an angle in degrees
inline double slope_to_angle(double slope_percent) {
    return rad_to_deg(std::atan(slope_percent / 100.0));
}

}  // namespace sectionpath

#endif // SECTIONPATH_MATH_ANGLES_HPP
