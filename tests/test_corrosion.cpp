#include <gtest/gtest.h>
#include "corrosion.hpp"
#include "errors.hpp"
#include <memory>

using namespace sectionpath;

namespace {

std::shared_ptr<const RHSProfile> make_rhs() {
    return std::make_shared<RHSProfile>(
        RHSDimensions::uniform(100.0, 200.0, 5.0, 7.5, 5.0), "RHS200x100x5");
}

std::shared_ptr<const CHSProfile> make_chs() {
    return std::make_shared<CHSProfile>(
        CHSDimensions{.outer_diameter = 100.0, .wall_thickness = 5.0}, "CHS 100x5");
}

std::shared_ptr<const LNPProfile> make_lnp() {
    return std::make_shared<LNPProfile>(
        LNPDimensions{.total_height = 60.0, .total_width = 40.0,
                      .web_thickness = 5.0, .base_thickness = 5.0,
                      .root_radius = 6.0, .web_toe_radius = 3.0, .base_toe_radius = 3.0},
        "LNP 60x40x5");
}

std::shared_ptr<const UNPProfile> make_unp() {
    return std::make_shared<UNPProfile>(UNPDimensions{
        .top_flange_total_width = 75.0,
        .top_flange_thickness = 11.5,
        .bottom_flange_total_width = 75.0,
        .bottom_flange_thickness = 11.5,
        .total_height = 200.0,
        .web_thickness = 8.5,
        .top_root_fillet_radius = 11.5,
        .top_toe_radius = 6.0,
        .bottom_root_fillet_radius = 11.5,
        .bottom_toe_radius = 6.0,
        .top_slope = 8.0,
        .bottom_slope = 8.0
    }, "UNP200");
}

std::shared_ptr<const StripProfile> make_strip() {
    return std::make_shared<StripProfile>(StripDimensions{.width = 100.0, .height = 4.0}, "100x4");
}

std::shared_ptr<const IProfile> make_i() {
    return std::make_shared<IProfile>(
        IDimensions{.top_flange_width = 100.0, .top_flange_thickness = 8.5,
                    .bottom_flange_width = 100.0, .bottom_flange_thickness = 8.5,
                    .total_height = 200.0, .web_thickness = 5.6,
                    .top_radius = 12.0, .bottom_radius = 12.0},
        "IPE200");
}

// A loss just short of the thinnest plate still builds a smaller section;
// reaching it is fully corroded
template <typename ProfileT>
void expect_uniform_limit(const std::shared_ptr<const ProfileT>& profile, double thinnest) {
    auto thin = with_corrosion(profile, UniformCorrosion{(thinnest - 0.01) / 2.0});
    EXPECT_GT(thin->area(), 0.0) << profile->name();
    EXPECT_LT(thin->area(), profile->area()) << profile->name();
    EXPECT_THROW(with_corrosion(profile, UniformCorrosion{thinnest / 2.0}), FullyCorrodedError)
        << profile->name();
    EXPECT_THROW(with_corrosion(profile, UniformCorrosion{thinnest}), FullyCorrodedError)
        << profile->name();
}

template <typename ProfileT>
void expect_hollow_limit(const std::shared_ptr<const ProfileT>& profile, double wall) {
    auto thin = with_corrosion(profile, HollowCorrosion{.outside = wall / 2.0, .inside = wall / 2.0 - 0.01});
    EXPECT_GT(thin->area(), 0.0) << profile->name();
    EXPECT_LT(thin->area(), profile->area()) << profile->name();
    EXPECT_THROW(with_corrosion(profile, HollowCorrosion{.outside = wall / 2.0, .inside = wall / 2.0}),
                 FullyCorrodedError) << profile->name();
    EXPECT_THROW(with_corrosion(profile, HollowCorrosion{.outside = wall, .inside = 0.5}),
                 FullyCorrodedError) << profile->name();
}

}  // namespace

// ============================================
// Name annotation
// ============================================

TEST(CorrosionNameTest, FormatsLikeDecimals) {
    EXPECT_EQ(corrosion::format_mm(1.0), "1.0");
    EXPECT_EQ(corrosion::format_mm(0.75), "0.75");
    EXPECT_EQ(corrosion::format_mm(2.5), "2.5");
    EXPECT_EQ(corrosion::format_mm(0.1), "0.1");
}

TEST(CorrosionNameTest, UniformAnnotationAccumulates) {
    std::string once = corrosion::update_name("IPE200", UniformCorrosion{1.5});
    EXPECT_EQ(once, "IPE200 (corrosion: 1.5 mm)");
    EXPECT_EQ(corrosion::update_name(once, UniformCorrosion{0.5}), "IPE200 (corrosion: 2.0 mm)");
}

TEST(CorrosionNameTest, HollowAnnotationAccumulates) {
    std::string once = corrosion::update_name("RHS200x100x5", HollowCorrosion{.outside = 2.0, .inside = 1.0});
    EXPECT_EQ(once, "RHS200x100x5 (corrosion inside: 1.0 mm, outside: 2.0 mm)");
    EXPECT_EQ(corrosion::update_name(once, HollowCorrosion{.outside = 0.5, .inside = 0.0}),
              "RHS200x100x5 (corrosion inside: 1.0 mm, outside: 2.5 mm)");
}

TEST(CorrosionNameTest, ParseName) {
    auto plain = corrosion::parse_name("UNP200");
    EXPECT_EQ(plain.base_name, "UNP200");
    EXPECT_FALSE(plain.uniform.has_value());
    EXPECT_FALSE(plain.hollow.has_value());

    auto uniform = corrosion::parse_name("UNP200 (corrosion: 1.25 mm)");
    EXPECT_EQ(uniform.base_name, "UNP200");
    ASSERT_TRUE(uniform.uniform.has_value());
    EXPECT_DOUBLE_EQ(*uniform.uniform, 1.25);

    auto hollow = corrosion::parse_name("CHS 21.3x2.3 (corrosion inside: 0.5 mm, outside: 1.0 mm)");
    EXPECT_EQ(hollow.base_name, "CHS 21.3x2.3");
    ASSERT_TRUE(hollow.hollow.has_value());
    EXPECT_DOUBLE_EQ(hollow.hollow->inside, 0.5);
    EXPECT_DOUBLE_EQ(hollow.hollow->outside, 1.0);
}

// ============================================
// Hollow sections
// ============================================

TEST(CorrosionTest, RHSOutsideAndInside) {
    auto rhs = make_rhs();
    auto corroded = with_corrosion(rhs, HollowCorrosion{.outside = 1.0, .inside = 0.5});
    const auto& d = corroded->dimensions();
    EXPECT_DOUBLE_EQ(d.total_width, 98.0);
    EXPECT_DOUBLE_EQ(d.total_height, 198.0);
    EXPECT_DOUBLE_EQ(d.left_wall_thickness, 3.5);
    EXPECT_DOUBLE_EQ(d.right_wall_thickness, 3.5);
    EXPECT_DOUBLE_EQ(d.top_wall_thickness, 3.5);
    EXPECT_DOUBLE_EQ(d.bottom_wall_thickness, 3.5);
    EXPECT_DOUBLE_EQ(d.top_right_outer_radius, 6.5);
    EXPECT_DOUBLE_EQ(d.top_right_inner_radius, 5.5);
    EXPECT_LT(corroded->area(), rhs->area());
    EXPECT_EQ(corroded->name(), "RHS200x100x5 (corrosion inside: 0.5 mm, outside: 1.0 mm)");
}

TEST(CorrosionTest, CHSKeepsWallIdentity) {
    auto chs = make_chs();
    auto corroded = with_corrosion(chs, HollowCorrosion{.outside = 0.8, .inside = 0.3});
    const auto& d = corroded->dimensions();
    EXPECT_DOUBLE_EQ(d.outer_diameter, 98.4);
    EXPECT_NEAR(d.wall_thickness, 3.9, 1e-12);
    EXPECT_NEAR(d.wall_thickness, (d.outer_diameter - d.inner_diameter()) / 2.0, 1e-12);
    EXPECT_NEAR(d.inner_diameter(), 90.0 + 0.6, 1e-12);
    EXPECT_LT(corroded->area(), chs->area());
}

TEST(CorrosionTest, OuterRadiusClampsAtZero) {
    std::shared_ptr<const RHSProfile> rhs = std::make_shared<RHSProfile>(RHSDimensions::uniform(100.0, 100.0, 10.0, 1.0, 0.0));
    auto corroded = with_corrosion(rhs, HollowCorrosion{.outside = 2.0, .inside = 0.0});
    EXPECT_DOUBLE_EQ(corroded->dimensions().bottom_left_outer_radius, 0.0);
    EXPECT_DOUBLE_EQ(corroded->dimensions().bottom_left_inner_radius, 0.0);
}

// ============================================
// Open sections
// ============================================

TEST(CorrosionTest, LNPAllFaces) {
    auto lnp = make_lnp();
    auto corroded = with_corrosion(lnp, UniformCorrosion{1.0});
    const auto& d = corroded->dimensions();
    EXPECT_DOUBLE_EQ(d.total_height, 58.0);
    EXPECT_DOUBLE_EQ(d.total_width, 38.0);
    EXPECT_DOUBLE_EQ(d.web_thickness, 3.0);
    EXPECT_DOUBLE_EQ(d.root_radius, 7.0);
    EXPECT_DOUBLE_EQ(d.web_toe_radius, 2.0);
    EXPECT_DOUBLE_EQ(d.back_radius, 0.0);
    EXPECT_LT(corroded->area(), lnp->area());
    EXPECT_EQ(corroded->name(), "LNP 60x40x5 (corrosion: 1.0 mm)");
}

TEST(CorrosionTest, UNPAllFaces) {
    auto unp = make_unp();
    auto corroded = with_corrosion(unp, UniformCorrosion{1.0});
    const auto& d = corroded->dimensions();
    EXPECT_DOUBLE_EQ(d.total_height, 198.0);
    EXPECT_DOUBLE_EQ(d.web_thickness, 6.5);
    EXPECT_DOUBLE_EQ(d.top_flange_thickness, 9.5);
    EXPECT_DOUBLE_EQ(d.top_root_fillet_radius, 12.5);
    EXPECT_DOUBLE_EQ(d.top_toe_radius, 5.0);
    EXPECT_DOUBLE_EQ(d.top_slope, 8.0);
    EXPECT_LT(corroded->area(), unp->area());
}

TEST(CorrosionTest, LNPToeRadiusFollowsThinningLeg) {
    auto lnp = make_lnp();
    for (double c : {2.3, 2.4}) {
        auto corroded = with_corrosion(lnp, UniformCorrosion{c});
        const auto& d = corroded->dimensions();
        EXPECT_NEAR(d.web_toe_radius, d.web_thickness, 1e-12) << c;
        EXPECT_NEAR(corroded->web_toe_straight_part(), 0.0, 1e-12) << c;
        EXPECT_GE(corroded->base_toe_straight_part(), 0.0) << c;
        EXPECT_LT(corroded->area(), lnp->area()) << c;
    }
}

TEST(CorrosionTest, UNPToeRadiusFollowsThinningFlange) {
    auto unp = make_unp();
    auto corroded = with_corrosion(unp, UniformCorrosion{3.0});
    const auto& d = corroded->dimensions();
    EXPECT_DOUBLE_EQ(d.web_thickness, 2.5);
    EXPECT_LT(d.top_toe_radius, 3.0);
    EXPECT_GT(d.top_toe_radius, 0.0);
    EXPECT_GE(corroded->top_flange().toe_flat_height, 0.0);
    EXPECT_GE(corroded->bottom_flange().toe_flat_height, 0.0);
    EXPECT_LT(corroded->area(), unp->area());
}

TEST(CorrosionTest, UNPEdgeThicknessCountsAsPlate) {
    // Wide, thin flanges run out at the toe edge before anywhere else
    auto unp = std::make_shared<UNPProfile>(UNPDimensions{
        .top_flange_total_width = 100.0,
        .top_flange_thickness = 6.0,
        .bottom_flange_total_width = 100.0,
        .bottom_flange_thickness = 6.0,
        .total_height = 200.0,
        .web_thickness = 8.0,
        .top_root_fillet_radius = 6.0,
        .bottom_root_fillet_radius = 6.0,
        .top_slope = 8.0,
        .bottom_slope = 8.0
    });
    double edge = UNPFlangeGeometry::edge_thickness(100.0, 6.0, 8.0);
    EXPECT_DOUBLE_EQ(edge, 2.0);
    EXPECT_NO_THROW(with_corrosion(unp, UniformCorrosion{0.9}));
    EXPECT_THROW(with_corrosion(unp, UniformCorrosion{1.1}), FullyCorrodedError);
}

TEST(CorrosionTest, IBeam) {
    auto beam = make_i();
    auto corroded = with_corrosion(beam, UniformCorrosion{0.5});
    EXPECT_DOUBLE_EQ(corroded->dimensions().web_thickness, 4.6);
    EXPECT_DOUBLE_EQ(corroded->dimensions().top_radius, 12.5);
    EXPECT_LT(corroded->area(), beam->area());
}

// ============================================
// Shared behaviour
// ============================================

TEST(CorrosionTest, ZeroLossReturnsSameInstance) {
    auto rhs = make_rhs();
    auto chs = make_chs();
    auto lnp = make_lnp();
    auto unp = make_unp();
    auto strip = make_strip();
    auto beam = make_i();
    EXPECT_EQ(with_corrosion(rhs, HollowCorrosion{}).get(), rhs.get());
    EXPECT_EQ(with_corrosion(chs, HollowCorrosion{}).get(), chs.get());
    EXPECT_EQ(with_corrosion(lnp, UniformCorrosion{}).get(), lnp.get());
    EXPECT_EQ(with_corrosion(unp, UniformCorrosion{}).get(), unp.get());
    EXPECT_EQ(with_corrosion(strip, UniformCorrosion{}).get(), strip.get());
    EXPECT_EQ(with_corrosion(beam, UniformCorrosion{}).get(), beam.get());
}

TEST(CorrosionTest, NegativeLossFails) {
    EXPECT_THROW(with_corrosion(make_rhs(), HollowCorrosion{.outside = -0.1, .inside = 0.0}),
                 NegativeValueError);
    EXPECT_THROW(with_corrosion(make_chs(), HollowCorrosion{.outside = 0.0, .inside = -0.1}),
                 NegativeValueError);
    EXPECT_THROW(with_corrosion(make_strip(), UniformCorrosion{-1.0}), NegativeValueError);
}

TEST(CorrosionTest, FullyCorrodedThreshold) {
    // RHS / CHS: outside + inside against the 5 mm wall
    EXPECT_THROW(with_corrosion(make_rhs(), HollowCorrosion{.outside = 3.0, .inside = 2.0}),
                 FullyCorrodedError);
    EXPECT_THROW(with_corrosion(make_chs(), HollowCorrosion{.outside = 2.5, .inside = 2.5}),
                 FullyCorrodedError);
    EXPECT_NO_THROW(with_corrosion(make_chs(), HollowCorrosion{.outside = 2.5, .inside = 2.4}));

    // Open sections lose material on both faces of every plate
    EXPECT_THROW(with_corrosion(make_strip(), UniformCorrosion{2.0}), FullyCorrodedError);
    auto thin = with_corrosion(make_strip(), UniformCorrosion{1.9});
    EXPECT_NEAR(thin->dimensions().height, 0.2, 1e-12);
    EXPECT_LT(thin->area(), make_strip()->area());
    EXPECT_THROW(with_corrosion(make_lnp(), UniformCorrosion{2.5}), FullyCorrodedError);
}

TEST(CorrosionTest, LimitIsTheThinnestPlate) {
    expect_hollow_limit(make_chs(), 5.0);
    expect_hollow_limit(make_rhs(), 5.0);
    expect_uniform_limit(make_lnp(), 5.0);
    expect_uniform_limit(make_unp(), 8.5);
    expect_uniform_limit(make_strip(), 4.0);
    expect_uniform_limit(make_i(), 5.6);
}

TEST(CorrosionTest, FullyCorrodedMessage) {
    try {
        with_corrosion(make_strip(), UniformCorrosion{5.0});
        FAIL() << "Expected FullyCorrodedError";
    } catch (const FullyCorrodedError& e) {
        EXPECT_STREQ(e.what(), "The profile has fully corroded.");
    }
}

TEST(CorrosionTest, IncrementsCompose) {
    auto rhs_twice = with_corrosion(with_corrosion(make_rhs(), HollowCorrosion{.outside = 0.5, .inside = 0.25}),
                                    HollowCorrosion{.outside = 0.25, .inside = 0.125});
    auto rhs_once = with_corrosion(make_rhs(), HollowCorrosion{.outside = 0.75, .inside = 0.375});
    EXPECT_EQ(rhs_twice->name(), rhs_once->name());
    EXPECT_NEAR(rhs_twice->area(), rhs_once->area(), 1e-9);
    EXPECT_NEAR(rhs_twice->dimensions().top_wall_thickness,
                rhs_once->dimensions().top_wall_thickness, 1e-9);

    auto chs_twice = with_corrosion(with_corrosion(make_chs(), HollowCorrosion{.outside = 0.5, .inside = 0.5}),
                                    HollowCorrosion{.outside = 0.25, .inside = 0.0});
    auto chs_once = with_corrosion(make_chs(), HollowCorrosion{.outside = 0.75, .inside = 0.5});
    EXPECT_EQ(chs_twice->name(), chs_once->name());
    EXPECT_NEAR(chs_twice->area(), chs_once->area(), 1e-9);

    auto lnp_twice = with_corrosion(with_corrosion(make_lnp(), UniformCorrosion{0.5}), UniformCorrosion{0.25});
    auto lnp_once = with_corrosion(make_lnp(), UniformCorrosion{0.75});
    EXPECT_EQ(lnp_twice->name(), "LNP 60x40x5 (corrosion: 0.75 mm)");
    EXPECT_EQ(lnp_twice->name(), lnp_once->name());
    EXPECT_NEAR(lnp_twice->area(), lnp_once->area(), 1e-9);

    auto unp_twice = with_corrosion(with_corrosion(make_unp(), UniformCorrosion{0.5}), UniformCorrosion{0.25});
    auto unp_once = with_corrosion(make_unp(), UniformCorrosion{0.75});
    EXPECT_EQ(unp_twice->name(), unp_once->name());
    EXPECT_NEAR(unp_twice->area(), unp_once->area(), 1e-9);

    auto strip_twice = with_corrosion(with_corrosion(make_strip(), UniformCorrosion{0.5}), UniformCorrosion{0.25});
    auto strip_once = with_corrosion(make_strip(), UniformCorrosion{0.75});
    EXPECT_EQ(strip_twice->name(), strip_once->name());
    EXPECT_NEAR(strip_twice->area(), strip_once->area(), 1e-9);

    auto i_twice = with_corrosion(with_corrosion(make_i(), UniformCorrosion{0.5}), UniformCorrosion{0.25});
    auto i_once = with_corrosion(make_i(), UniformCorrosion{0.75});
    EXPECT_EQ(i_twice->name(), i_once->name());
    EXPECT_NEAR(i_twice->area(), i_once->area(), 1e-9);
}

TEST(CorrosionTest, PlacementIsKept) {
    auto placed = make_rhs()->transform(50.0, 25.0, 90.0);
    auto corroded = with_corrosion(placed, HollowCorrosion{.outside = 1.0, .inside = 0.0});
    EXPECT_DOUBLE_EQ(corroded->placement().horizontal_offset, 50.0);
    EXPECT_DOUBLE_EQ(corroded->placement().vertical_offset, 25.0);
    EXPECT_DOUBLE_EQ(corroded->placement().rotation, 90.0);
    EXPECT_NEAR(corroded->centroid().x, 50.0, 1e-9);
    EXPECT_NEAR(corroded->profile_width(), 198.0, 1e-6);
}

TEST(CorrosionTest, DispatchOnFamily) {
    std::shared_ptr<const Profile> strip = make_strip();
    auto corroded = with_corrosion(strip, HollowCorrosion{.outside = 1.0, .inside = 0.0});
    EXPECT_EQ(corroded->name(), "100x4 (corrosion: 1.0 mm)");
    EXPECT_THROW(with_corrosion(strip, HollowCorrosion{.outside = 1.0, .inside = 1.0}),
                 ValidationError);

    std::shared_ptr<const Profile> corner = std::make_shared<CorneredProfile>(
        CorneredDimensions{.thickness_vertical = 5.0, .thickness_horizontal = 5.0,
                           .inner_radius = 10.0, .outer_radius = 15.0});
    EXPECT_EQ(with_corrosion(corner, HollowCorrosion{}).get(), corner.get());
    EXPECT_THROW(with_corrosion(corner, HollowCorrosion{.outside = 1.0, .inside = 0.0}),
                 ValidationError);
}
