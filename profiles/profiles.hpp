#ifndef SECTIONPATH_PROFILES_PROFILES_HPP
#define SECTIONPATH_PROFILES_PROFILES_HPP

// Cross-section families
//
// Usage:
//   auto rhs = std::make_shared<RHSProfile>(
//       RHSDimensions::uniform(100.0, 200.0, 5.0, 7.5, 5.0), "RHS200x100x5");
//   double a = rhs->area();
//   const ClosedPolygon& boundary = rhs->polygon();

#include "profile.hpp"
#include "chs_profile.hpp"
#include "rhs_profile.hpp"
#include "lnp_profile.hpp"
#include "unp_profile.hpp"
#include "strip_profile.hpp"
#include "i_profile.hpp"
#include "cornered_profile.hpp"
#include "annular_sector_profile.hpp"

#endif // SECTIONPATH_PROFILES_PROFILES_HPP
