#include "corrosion.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "validation.hpp"
#include <algorithm>
#include <charconv>
#include <initializer_list>
#include <regex>
#include <spdlog/fmt/fmt.h>

namespace sectionpath {

namespace corrosion {

namespace {

const std::regex& uniform_pattern() {
    static const std::regex pattern(R"(\s*\(corrosion:\s*([0-9.]+)\s*mm\)\s*$)");
    return pattern;
}

const std::regex& hollow_pattern() {
    static const std::regex pattern(
        R"(\s*\(corrosion\s+inside:\s*([0-9.]+)\s*mm,\s*outside:\s*([0-9.]+)\s*mm\)\s*$)");
    return pattern;
}

double parse_number(const std::string& text) {
    try {
        return std::stod(text);
    } catch (const std::exception&) {
        throw ValidationError("Malformed corrosion annotation value: " + text);
    }
}

bool has_fraction_marker(const char* begin, const char* end) {
    return std::find_if(begin, end, [](char c) {
        return c == '.' || c == 'e' || c == 'n' || c == 'i';
    }) != end;
}

}  // namespace

std::string format_mm(double value) {
    char buf[64];
    auto result = std::to_chars(buf, buf + sizeof(buf), value);
    std::string text(buf, result.ptr);
    if (!has_fraction_marker(buf, result.ptr)) {
        text += ".0";
    }
    return text;
}

NameAnnotation parse_name(const std::string& name) {
    NameAnnotation out;
    std::smatch match;
    if (std::regex_search(name, match, hollow_pattern())) {
        out.base_name = name.substr(0, static_cast<size_t>(match.position(0)));
        out.hollow = HollowCorrosion{
            .outside = parse_number(match[2].str()),
            .inside = parse_number(match[1].str())
        };
    } else if (std::regex_search(name, match, uniform_pattern())) {
        out.base_name = name.substr(0, static_cast<size_t>(match.position(0)));
        out.uniform = parse_number(match[1].str());
    } else {
        out.base_name = name;
    }
    return out;
}

std::string update_name(const std::string& name, const UniformCorrosion& loss) {
    NameAnnotation prior = parse_name(name);
    if (prior.hollow) {
        prior.base_name = name;
    }
    double total = loss.corrosion + prior.uniform.value_or(0.0);
    return fmt::format("{} (corrosion: {} mm)", prior.base_name, format_mm(total));
}

std::string update_name(const std::string& name, const HollowCorrosion& loss) {
    NameAnnotation prior = parse_name(name);
    if (prior.uniform) {
        prior.base_name = name;
    }
    HollowCorrosion recorded = prior.hollow.value_or(HollowCorrosion{});
    return fmt::format("{} (corrosion inside: {} mm, outside: {} mm)", prior.base_name,
                       format_mm(loss.inside + recorded.inside),
                       format_mm(loss.outside + recorded.outside));
}

}  // namespace corrosion

namespace {

void check_thicknesses(std::initializer_list<double> thicknesses) {
    for (double t : thicknesses) {
        if (t <= FULL_CORROSION_TOLERANCE) {
            throw FullyCorrodedError();
        }
    }
}

// Convex radii shrink with the surface but never past what the thinned plate can hold
double shrink_convex(double radius, double loss, double limit) {
    return std::clamp(radius - loss, 0.0, std::max(limit, 0.0));
}

void log_corrosion(const std::string& from, const std::string& to) {
    logging::get_logger()->debug("Corrosion: '{}' -> '{}'", from, to);
}

}  // namespace

std::shared_ptr<const CHSProfile> with_corrosion(
    const std::shared_ptr<const CHSProfile>& profile, const HollowCorrosion& loss) {
    require_non_negative("corrosion_outside", loss.outside);
    require_non_negative("corrosion_inside", loss.inside);
    if (loss.outside == 0.0 && loss.inside == 0.0) {
        return profile;
    }

    const auto& d = profile->dimensions();
    CHSDimensions next{
        .outer_diameter = d.outer_diameter - 2.0 * loss.outside,
        .wall_thickness = d.wall_thickness - loss.outside - loss.inside
    };
    check_thicknesses({next.wall_thickness});

    std::string name = corrosion::update_name(profile->name(), loss);
    log_corrosion(profile->name(), name);
    return std::make_shared<CHSProfile>(next, name, profile->placement());
}

std::shared_ptr<const RHSProfile> with_corrosion(
    const std::shared_ptr<const RHSProfile>& profile, const HollowCorrosion& loss) {
    require_non_negative("corrosion_outside", loss.outside);
    require_non_negative("corrosion_inside", loss.inside);
    if (loss.outside == 0.0 && loss.inside == 0.0) {
        return profile;
    }

    const auto& d = profile->dimensions();
    double wall_loss = loss.outside + loss.inside;
    auto outer_r = [&](double r) { return std::max(r - loss.outside, 0.0); };
    auto inner_r = [&](double r) { return r + loss.inside; };

    RHSDimensions next{
        .total_width = d.total_width - 2.0 * loss.outside,
        .total_height = d.total_height - 2.0 * loss.outside,
        .left_wall_thickness = d.left_wall_thickness - wall_loss,
        .right_wall_thickness = d.right_wall_thickness - wall_loss,
        .top_wall_thickness = d.top_wall_thickness - wall_loss,
        .bottom_wall_thickness = d.bottom_wall_thickness - wall_loss,
        .top_right_outer_radius = outer_r(d.top_right_outer_radius),
        .top_left_outer_radius = outer_r(d.top_left_outer_radius),
        .bottom_right_outer_radius = outer_r(d.bottom_right_outer_radius),
        .bottom_left_outer_radius = outer_r(d.bottom_left_outer_radius),
        .top_right_inner_radius = inner_r(d.top_right_inner_radius),
        .top_left_inner_radius = inner_r(d.top_left_inner_radius),
        .bottom_right_inner_radius = inner_r(d.bottom_right_inner_radius),
        .bottom_left_inner_radius = inner_r(d.bottom_left_inner_radius)
    };
    check_thicknesses({next.left_wall_thickness, next.right_wall_thickness,
                       next.top_wall_thickness, next.bottom_wall_thickness});

    std::string name = corrosion::update_name(profile->name(), loss);
    log_corrosion(profile->name(), name);
    return std::make_shared<RHSProfile>(next, name, profile->placement());
}

std::shared_ptr<const LNPProfile> with_corrosion(
    const std::shared_ptr<const LNPProfile>& profile, const UniformCorrosion& loss) {
    require_non_negative("corrosion", loss.corrosion);
    if (loss.corrosion == 0.0) {
        return profile;
    }

    const auto& d = profile->dimensions();
    double c = loss.corrosion;
    double web = d.web_thickness - 2.0 * c;
    double base = d.base_thickness - 2.0 * c;
    double root = d.root_radius + c;
    LNPDimensions next{
        .total_height = d.total_height - 2.0 * c,
        .total_width = d.total_width - 2.0 * c,
        .web_thickness = web,
        .base_thickness = base,
        .root_radius = root,
        .back_radius = shrink_convex(d.back_radius, c, std::min(web, base) + root),
        .web_toe_radius = shrink_convex(d.web_toe_radius, c, web),
        .base_toe_radius = shrink_convex(d.base_toe_radius, c, base)
    };
    check_thicknesses({next.web_thickness, next.base_thickness});

    std::string name = corrosion::update_name(profile->name(), loss);
    log_corrosion(profile->name(), name);
    return std::make_shared<LNPProfile>(next, name, profile->placement());
}

std::shared_ptr<const UNPProfile> with_corrosion(
    const std::shared_ptr<const UNPProfile>& profile, const UniformCorrosion& loss) {
    require_non_negative("corrosion", loss.corrosion);
    if (loss.corrosion == 0.0) {
        return profile;
    }

    const auto& d = profile->dimensions();
    double c = loss.corrosion;
    double top_width = d.top_flange_total_width - 2.0 * c;
    double top_thickness = d.top_flange_thickness - 2.0 * c;
    double bottom_width = d.bottom_flange_total_width - 2.0 * c;
    double bottom_thickness = d.bottom_flange_thickness - 2.0 * c;
    double web = d.web_thickness - 2.0 * c;
    double top_root = d.top_root_fillet_radius + c;
    double bottom_root = d.bottom_root_fillet_radius + c;
    check_thicknesses({top_thickness, bottom_thickness, web,
                       UNPFlangeGeometry::edge_thickness(top_width, top_thickness, d.top_slope),
                       UNPFlangeGeometry::edge_thickness(bottom_width, bottom_thickness, d.bottom_slope)});

    UNPDimensions next{
        .top_flange_total_width = top_width,
        .top_flange_thickness = top_thickness,
        .bottom_flange_total_width = bottom_width,
        .bottom_flange_thickness = bottom_thickness,
        .total_height = d.total_height - 2.0 * c,
        .web_thickness = web,
        .top_root_fillet_radius = top_root,
        .top_toe_radius = shrink_convex(
            d.top_toe_radius, c,
            UNPFlangeGeometry::max_toe_radius(top_width, top_thickness, d.top_slope)),
        .top_outer_corner_radius = shrink_convex(
            d.top_outer_corner_radius, c, std::min(top_thickness, web) + top_root),
        .bottom_root_fillet_radius = bottom_root,
        .bottom_toe_radius = shrink_convex(
            d.bottom_toe_radius, c,
            UNPFlangeGeometry::max_toe_radius(bottom_width, bottom_thickness, d.bottom_slope)),
        .bottom_outer_corner_radius = shrink_convex(
            d.bottom_outer_corner_radius, c, std::min(bottom_thickness, web) + bottom_root),
        .top_slope = d.top_slope,
        .bottom_slope = d.bottom_slope
    };

    std::string name = corrosion::update_name(profile->name(), loss);
    log_corrosion(profile->name(), name);
    return std::make_shared<UNPProfile>(next, name, profile->placement());
}

std::shared_ptr<const StripProfile> with_corrosion(
    const std::shared_ptr<const StripProfile>& profile, const UniformCorrosion& loss) {
    require_non_negative("corrosion", loss.corrosion);
    if (loss.corrosion == 0.0) {
        return profile;
    }

    const auto& d = profile->dimensions();
    StripDimensions next{
        .width = d.width - 2.0 * loss.corrosion,
        .height = d.height - 2.0 * loss.corrosion
    };
    check_thicknesses({next.width, next.height});

    std::string name = corrosion::update_name(profile->name(), loss);
    log_corrosion(profile->name(), name);
    return std::make_shared<StripProfile>(next, name, profile->placement());
}

std::shared_ptr<const IProfile> with_corrosion(
    const std::shared_ptr<const IProfile>& profile, const UniformCorrosion& loss) {
    require_non_negative("corrosion", loss.corrosion);
    if (loss.corrosion == 0.0) {
        return profile;
    }

    const auto& d = profile->dimensions();
    double c = loss.corrosion;
    IDimensions next{
        .top_flange_width = d.top_flange_width - 2.0 * c,
        .top_flange_thickness = d.top_flange_thickness - 2.0 * c,
        .bottom_flange_width = d.bottom_flange_width - 2.0 * c,
        .bottom_flange_thickness = d.bottom_flange_thickness - 2.0 * c,
        .total_height = d.total_height - 2.0 * c,
        .web_thickness = d.web_thickness - 2.0 * c,
        .top_radius = d.top_radius + c,
        .bottom_radius = d.bottom_radius + c
    };
    check_thicknesses({next.top_flange_thickness, next.bottom_flange_thickness,
                       next.web_thickness});

    std::string name = corrosion::update_name(profile->name(), loss);
    log_corrosion(profile->name(), name);
    return std::make_shared<IProfile>(next, name, profile->placement());
}

std::shared_ptr<const Profile> with_corrosion(
    const std::shared_ptr<const Profile>& profile, const HollowCorrosion& loss) {
    if (auto chs = std::dynamic_pointer_cast<const CHSProfile>(profile)) {
        return with_corrosion(chs, loss);
    }
    if (auto rhs = std::dynamic_pointer_cast<const RHSProfile>(profile)) {
        return with_corrosion(rhs, loss);
    }

    require_non_negative("corrosion_outside", loss.outside);
    require_non_negative("corrosion_inside", loss.inside);
    if (loss.inside != 0.0) {
        throw ValidationError(fmt::format(
            "{} profiles corrode uniformly; corrosion_inside must be 0", profile->family()));
    }

    UniformCorrosion uniform{.corrosion = loss.outside};
    if (auto lnp = std::dynamic_pointer_cast<const LNPProfile>(profile)) {
        return with_corrosion(lnp, uniform);
    }
    if (auto unp = std::dynamic_pointer_cast<const UNPProfile>(profile)) {
        return with_corrosion(unp, uniform);
    }
    if (auto strip = std::dynamic_pointer_cast<const StripProfile>(profile)) {
        return with_corrosion(strip, uniform);
    }
    if (auto i = std::dynamic_pointer_cast<const IProfile>(profile)) {
        return with_corrosion(i, uniform);
    }

    if (loss.outside == 0.0) {
        return profile;
    }
    throw ValidationError(fmt::format(
        "{} profiles do not support corrosion", profile->family()));
}

}  // namespace sectionpath
