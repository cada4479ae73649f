#include "cornered_profile.hpp"
#include "angles.hpp"
#include "validation.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>
#include <spdlog/fmt/fmt.h>

namespace sectionpath {

namespace {

struct ArcSamples {
    Ring points;
    double width = 0.0;
    double height = 0.0;
};

// ARC_POINTS samples from angle `from` to `to` (radians), inclusive
ArcSamples sample_arc(double radius, double from, double to) {
    ArcSamples arc;
    int n = CorneredProfile::ARC_POINTS;
    arc.points.reserve(n);
    for (int i = 0; i < n; ++i) {
        double t = from + (to - from) * static_cast<double>(i) / static_cast<double>(n - 1);
        arc.points.push_back({radius * std::cos(t), radius * std::sin(t)});
    }

    auto [min_x, max_x] = std::minmax_element(arc.points.begin(), arc.points.end(),
        [](const Point2D& a, const Point2D& b) { return a.x < b.x; });
    auto [min_y, max_y] = std::minmax_element(arc.points.begin(), arc.points.end(),
        [](const Point2D& a, const Point2D& b) { return a.y < b.y; });
    arc.width = max_x->x - min_x->x;
    arc.height = max_y->y - min_y->y;
    return arc;
}

// Shifts samples so the minimum corner sits at (dx, dy)
void align_arc(ArcSamples& arc, double dx, double dy) {
    double min_x = arc.points.front().x;
    double min_y = arc.points.front().y;
    for (const auto& p : arc.points) {
        min_x = std::min(min_x, p.x);
        min_y = std::min(min_y, p.y);
    }
    for (auto& p : arc.points) {
        p.x += dx - min_x;
        p.y += dy - min_y;
    }
}

// Solves [[a, b], [c, d]] * (u, v) = (e, f)
std::pair<double, double> solve2(double a, double b, double c, double d, double e, double f) {
    double det = a * d - b * c;
    return {(e * d - b * f) / det, (a * f - e * c) / det};
}

}  // namespace

CorneredProfile::CorneredProfile(const CorneredDimensions& dimensions, std::string name,
                                 const Placement& placement)
    : Profile(std::move(name), placement), dimensions_(dimensions) {
    const auto& d = dimensions_;
    require_non_negative({
        {"thickness_vertical", d.thickness_vertical},
        {"thickness_horizontal", d.thickness_horizontal},
        {"inner_radius", d.inner_radius},
        {"outer_radius", d.outer_radius},
        {"inner_slope_at_vertical", d.inner_slope_at_vertical},
        {"inner_slope_at_horizontal", d.inner_slope_at_horizontal},
        {"outer_slope_at_vertical", d.outer_slope_at_vertical},
        {"outer_slope_at_horizontal", d.outer_slope_at_horizontal}
    });

    if (d.reference_point != "intersection" && d.reference_point != "outer") {
        throw ValidationError(fmt::format(
            "reference_point must be either 'intersection' or 'outer', got {}", d.reference_point));
    }
    if (d.corner_direction < 0 || d.corner_direction > 3) {
        throw ValidationError(fmt::format(
            "corner_direction must be one of 0, 1, 2, or 3, got {}", d.corner_direction));
    }
    for (double slope : {d.inner_slope_at_vertical, d.inner_slope_at_horizontal,
                         d.outer_slope_at_vertical, d.outer_slope_at_horizontal}) {
        if (slope >= 100.0) {
            throw ValidationError("All slopes must be less than 100%");
        }
    }
    double thinnest = std::min(d.thickness_vertical, d.thickness_horizontal);
    if (d.outer_radius > d.inner_radius + thinnest) {
        throw ValidationError(fmt::format(
            "Outer radius {} must be smaller than or equal to inner radius {} plus the thickness {}",
            d.outer_radius, d.inner_radius, thinnest));
    }

    set_geometry(compose());
}

double CorneredProfile::max_profile_thickness() const {
    return std::max(dimensions_.thickness_vertical, dimensions_.thickness_horizontal);
}

ClosedPolygon CorneredProfile::compose() {
    const auto& d = dimensions_;
    double i_h = deg_to_rad(slope_to_angle(d.inner_slope_at_horizontal));
    double i_v = deg_to_rad(slope_to_angle(d.inner_slope_at_vertical));
    double o_h = deg_to_rad(slope_to_angle(d.outer_slope_at_horizontal));
    double o_v = deg_to_rad(slope_to_angle(d.outer_slope_at_vertical));
    constexpr double quarter = std::numbers::pi / 2.0;

    // Outer arc runs from the horizontal leg to the vertical leg
    ArcSamples outer = sample_arc(d.outer_radius, o_h, quarter - o_v);
    ArcSamples inner = sample_arc(d.inner_radius, i_h, quarter - i_v);
    std::reverse(inner.points.begin(), inner.points.end());

    // Extend whichever arc falls short so the leg faces line up; the
    // inner arc is tried first
    auto [i_ext_h, i_ext_v] = solve2(
        std::sin(i_h), std::cos(i_v),
        std::cos(i_h), std::sin(i_v),
        outer.width - inner.width - d.thickness_horizontal,
        outer.height - inner.height - d.thickness_vertical);
    double o_ext_h = 0.0;
    double o_ext_v = 0.0;
    if (i_ext_h < 0.0 || i_ext_v < 0.0) {
        std::tie(o_ext_h, o_ext_v) = solve2(
            std::sin(o_h), std::cos(o_v),
            std::cos(o_h), std::sin(o_v),
            inner.width + d.thickness_horizontal - outer.width,
            inner.height + d.thickness_vertical - outer.height);
        i_ext_h = 0.0;
        i_ext_v = 0.0;
    }

    total_width_ = outer.width + o_ext_h * std::sin(o_h) + o_ext_v * std::cos(o_v);
    total_height_ = outer.height + o_ext_h * std::cos(o_h) + o_ext_v * std::sin(o_v);

    align_arc(outer, o_ext_v * std::cos(o_v), o_ext_h * std::cos(o_h));
    align_arc(inner, i_ext_v * std::cos(i_v), i_ext_h * std::cos(i_h));

    Ring points;
    points.reserve(outer.points.size() + inner.points.size() + 4);
    points.push_back({total_width_, 0.0});
    points.insert(points.end(), outer.points.begin(), outer.points.end());
    points.push_back({0.0, total_height_});
    points.push_back({0.0, total_height_ - d.thickness_vertical});
    points.insert(points.end(), inner.points.begin(), inner.points.end());
    points.push_back({total_width_ - d.thickness_horizontal, 0.0});

    if (d.reference_point == "outer") {
        for (auto& p : points) {
            p -= Vec2{total_width_, total_height_};
        }
    }

    bool flip_x = d.corner_direction == 1 || d.corner_direction == 2;
    bool flip_y = d.corner_direction == 2 || d.corner_direction == 3;
    return ClosedPolygon(std::move(points))
        .mirrored(flip_x, flip_y)
        .translated({d.x, d.y});
}

std::shared_ptr<const Profile> CorneredProfile::with_placement(const Placement& placement) const {
    return std::make_shared<CorneredProfile>(dimensions_, name(), placement);
}

}  // namespace sectionpath
