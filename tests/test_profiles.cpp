#include <gtest/gtest.h>
#include "profiles.hpp"
#include "errors.hpp"
#include <cmath>
#include <memory>
#include <numbers>

using namespace sectionpath;

namespace {

RHSDimensions rhs_200x100x5() {
    return RHSDimensions::uniform(100.0, 200.0, 5.0, 7.5, 5.0);
}

}  // namespace

// ============================================
// RHS
// ============================================

TEST(RHSProfileTest, AreaMatchesRoundedRectangles) {
    RHSProfile rhs(rhs_200x100x5(), "RHS200x100x5");
    double outer = 200.0 * 100.0 - (4.0 - std::numbers::pi) * 7.5 * 7.5;
    double inner = 190.0 * 90.0 - (4.0 - std::numbers::pi) * 5.0 * 5.0;
    EXPECT_NEAR(rhs.area(), outer - inner, 0.5);
    EXPECT_NEAR(rhs.profile_width(), 100.0, 1e-9);
    EXPECT_NEAR(rhs.profile_height(), 200.0, 1e-9);
    EXPECT_NEAR(rhs.volume_per_meter(), rhs.area() * 1e-6, 1e-15);
    EXPECT_DOUBLE_EQ(rhs.max_profile_thickness(), 5.0);
    EXPECT_EQ(rhs.family(), "RHS");
    EXPECT_EQ(rhs.name(), "RHS200x100x5");
}

TEST(RHSProfileTest, CavityLiesInsideOuterRing) {
    RHSProfile rhs(rhs_200x100x5());
    const ClosedPolygon& p = rhs.polygon();
    ASSERT_EQ(p.holes().size(), 1u);
    EXPECT_TRUE(ring::is_simple(p.outer()));
    EXPECT_TRUE(ring::is_simple(p.holes()[0]));
    for (const auto& v : p.holes()[0]) {
        EXPECT_TRUE(ring::contains(p.outer(), v));
    }
    EXPECT_FALSE(ring::edges_touch(p.outer(), p.holes()[0]));
}

TEST(RHSProfileTest, CentredOnCentroid) {
    RHSProfile rhs(rhs_200x100x5());
    EXPECT_NEAR(rhs.centroid().x, 0.0, 1e-9);
    EXPECT_NEAR(rhs.centroid().y, 0.0, 1e-9);
}

TEST(RHSProfileTest, UnequalWalls) {
    RHSDimensions d = rhs_200x100x5();
    d.left_wall_thickness = 8.0;
    d.bottom_wall_thickness = 10.0;
    d.top_right_outer_radius = 0.0;
    d.top_right_inner_radius = 0.0;
    RHSProfile rhs(d);
    EXPECT_DOUBLE_EQ(rhs.max_profile_thickness(), 10.0);
    EXPECT_TRUE(ring::is_simple(rhs.polygon().holes()[0]));
    EXPECT_NEAR(rhs.profile_width(), 100.0, 1e-9);
    EXPECT_NEAR(rhs.profile_height(), 200.0, 1e-9);
}

TEST(RHSProfileTest, WallLengths) {
    RHSWallLengths w = RHSWallLengths::from_dimensions(rhs_200x100x5());
    EXPECT_DOUBLE_EQ(w.top_outer_width, 85.0);
    EXPECT_DOUBLE_EQ(w.right_outer_height, 185.0);
    EXPECT_DOUBLE_EQ(w.top_inner_width, 80.0);
    EXPECT_DOUBLE_EQ(w.right_inner_height, 180.0);
}

TEST(RHSProfileTest, RejectsInfeasibleDimensions) {
    RHSDimensions negative = rhs_200x100x5();
    negative.top_wall_thickness = -1.0;
    EXPECT_THROW(RHSProfile{negative}, NegativeValueError);

    // Corner radii wider than the section
    EXPECT_THROW(RHSProfile(RHSDimensions::uniform(20.0, 40.0, 5.0, 12.0, 5.0)),
                 NegativeValueError);
    // Walls meeting in the middle
    EXPECT_THROW(RHSProfile(RHSDimensions::uniform(20.0, 40.0, 8.0, 8.0, 4.0)),
                 NegativeValueError);
}

// ============================================
// CHS
// ============================================

TEST(CHSProfileTest, AnnulusArea) {
    CHSProfile chs({.outer_diameter = 100.0, .wall_thickness = 5.0});
    double exact = std::numbers::pi * (50.0 * 50.0 - 45.0 * 45.0);
    EXPECT_NEAR(chs.area(), exact, 0.5);
    EXPECT_LT(chs.area(), exact);
    EXPECT_NEAR(chs.profile_width(), 100.0, 0.01);
    EXPECT_NEAR(chs.centroid().x, 0.0, 1e-9);
    EXPECT_NEAR(chs.centroid().y, 0.0, 1e-9);
    EXPECT_DOUBLE_EQ(chs.max_profile_thickness(), 5.0);
}

TEST(CHSProfileTest, WallThicknessIdentity) {
    CHSDimensions d{.outer_diameter = 168.3, .wall_thickness = 7.1};
    EXPECT_NEAR(d.wall_thickness, (d.outer_diameter - d.inner_diameter()) / 2.0, 1e-12);
}

TEST(CHSProfileTest, SolidBarHasNoHole) {
    CHSProfile bar({.outer_diameter = 20.0, .wall_thickness = 10.0});
    EXPECT_TRUE(bar.polygon().holes().empty());
    // 72 chords at 5 degrees
    EXPECT_NEAR(bar.area(), 36.0 * 100.0 * std::sin(std::numbers::pi / 36.0), 1e-9);
}

TEST(CHSProfileTest, SmallDiametersUseFinerSegments) {
    CHSProfile small({.outer_diameter = 10.0, .wall_thickness = 1.0});
    CHSProfile large({.outer_diameter = 500.0, .wall_thickness = 10.0});
    EXPECT_DOUBLE_EQ(small.segment_angle(), 5.0);
    EXPECT_NEAR(large.segment_angle(), 360.0 / (std::numbers::pi * 500.0), 1e-12);
}

TEST(CHSProfileTest, RejectsInfeasibleDimensions) {
    EXPECT_THROW(CHSProfile({.outer_diameter = 0.0, .wall_thickness = 1.0}), NonPositiveValueError);
    EXPECT_THROW(CHSProfile({.outer_diameter = 10.0, .wall_thickness = 0.0}), NonPositiveValueError);
    EXPECT_THROW(CHSProfile({.outer_diameter = 10.0, .wall_thickness = 6.0}), NegativeValueError);
}

// ============================================
// LNP
// ============================================

TEST(LNPProfileTest, SharpAngleArea) {
    LNPProfile angle({.total_height = 50.0, .total_width = 50.0,
                      .web_thickness = 5.0, .base_thickness = 5.0});
    EXPECT_NEAR(angle.area(), 50.0 * 5.0 + 45.0 * 5.0, 1e-9);
    EXPECT_NEAR(angle.profile_width(), 50.0, 1e-9);
    EXPECT_NEAR(angle.profile_height(), 50.0, 1e-9);
    EXPECT_NEAR(angle.centroid().x, 0.0, 1e-9);
}

TEST(LNPProfileTest, RootFilletAddsMaterial) {
    LNPDimensions d{.total_height = 60.0, .total_width = 40.0,
                    .web_thickness = 5.0, .base_thickness = 5.0,
                    .root_radius = 6.0, .web_toe_radius = 3.0, .base_toe_radius = 3.0};
    LNPProfile angle(d, "LNP 60x40x5");
    double sharp = 60.0 * 5.0 + 35.0 * 5.0;
    double fillet = (1.0 - std::numbers::pi / 4.0) * 36.0;
    double toes = 2.0 * (1.0 - std::numbers::pi / 4.0) * 9.0;
    EXPECT_NEAR(angle.area(), sharp + fillet - toes, 0.05);
    EXPECT_DOUBLE_EQ(angle.web_toe_straight_part(), 2.0);
    EXPECT_DOUBLE_EQ(angle.web_inner_height(), 60.0 - 5.0 - 6.0 - 3.0);
    EXPECT_TRUE(ring::is_simple(angle.polygon().outer()));
}

TEST(LNPProfileTest, ToeRadiusLargerThanLegFails) {
    LNPDimensions d{.total_height = 60.0, .total_width = 40.0,
                    .web_thickness = 5.0, .base_thickness = 5.0,
                    .web_toe_radius = 6.0};
    EXPECT_THROW(LNPProfile{d}, NegativeValueError);
}

// ============================================
// UNP
// ============================================

namespace {

UNPDimensions unp200() {
    return UNPDimensions{
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
    };
}

}  // namespace

TEST(UNPProfileTest, ChannelArea) {
    UNPProfile channel(unp200(), "UNP200");
    EXPECT_NEAR(channel.area(), 3218.65, 1.0);
    EXPECT_NEAR(channel.profile_width(), 75.0, 1e-9);
    EXPECT_NEAR(channel.profile_height(), 200.0, 1e-9);
    EXPECT_DOUBLE_EQ(channel.max_profile_thickness(), 11.5);
    EXPECT_TRUE(ring::is_simple(channel.polygon().outer()));
}

TEST(UNPProfileTest, SymmetricAboutMidHeight) {
    UNPProfile channel(unp200());
    // Centred on the centroid, which sits on the horizontal axis of symmetry
    Bounds b = channel.polygon().bounds();
    EXPECT_NEAR(b.min_y, -100.0, 1e-6);
    EXPECT_NEAR(b.max_y, 100.0, 1e-6);
}

TEST(UNPProfileTest, FlangeGeometry) {
    UNPFlangeGeometry g = UNPFlangeGeometry::compute(75.0, 11.5, 8.5, 200.0, 11.5, 6.0, 8.0);
    EXPECT_NEAR(g.slope_angle, std::atan(0.08) * 180.0 / std::numbers::pi, 1e-12);
    EXPECT_GT(g.toe_flat_height, 0.0);
    EXPECT_GT(g.web_inner_height, 0.0);
    EXPECT_NEAR(g.slope_height, g.slope_width * 0.08, 1e-12);
}

TEST(UNPProfileTest, RejectsSteepSlopes) {
    UNPDimensions d = unp200();
    d.top_slope = 100.0;
    try {
        UNPProfile channel(d);
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_STREQ(e.what(), "All slopes must be less than 100%");
    }
}

TEST(UNPProfileTest, RejectsOversizedOuterCorner) {
    UNPDimensions d = unp200();
    d.bottom_outer_corner_radius = 120.0;
    EXPECT_THROW(UNPProfile{d}, NegativeValueError);
}

// ============================================
// Strip
// ============================================

TEST(StripProfileTest, Rectangle) {
    StripProfile strip({.width = 160.0, .height = 8.0}, "160x8");
    EXPECT_NEAR(strip.area(), 1280.0, 1e-9);
    EXPECT_NEAR(strip.perimeter(), 336.0, 1e-9);
    EXPECT_DOUBLE_EQ(strip.max_profile_thickness(), 8.0);
    EXPECT_EQ(strip.polygon().outer().size(), 4u);
}

TEST(StripProfileTest, RejectsZeroSize) {
    EXPECT_THROW(StripProfile({.width = 0.0, .height = 8.0}), NonPositiveValueError);
    EXPECT_THROW(StripProfile({.width = 10.0, .height = -1.0}), NonPositiveValueError);
}

// ============================================
// I
// ============================================

TEST(IProfileTest, SharpArea) {
    IProfile beam({.top_flange_width = 100.0, .top_flange_thickness = 10.0,
                   .bottom_flange_width = 100.0, .bottom_flange_thickness = 10.0,
                   .total_height = 200.0, .web_thickness = 6.0});
    EXPECT_NEAR(beam.area(), 2.0 * 100.0 * 10.0 + 6.0 * 180.0, 1e-9);
    EXPECT_NEAR(beam.profile_width(), 100.0, 1e-9);
    EXPECT_NEAR(beam.profile_height(), 200.0, 1e-9);
    EXPECT_EQ(beam.family(), "I");
}

TEST(IProfileTest, FilletsAndUnequalFlanges) {
    IProfile beam({.top_flange_width = 100.0, .top_flange_thickness = 10.0,
                   .bottom_flange_width = 160.0, .bottom_flange_thickness = 12.0,
                   .total_height = 300.0, .web_thickness = 8.0,
                   .top_radius = 5.0, .bottom_radius = 5.0});
    double flat = 100.0 * 10.0 + 160.0 * 12.0 + 8.0 * 278.0;
    EXPECT_NEAR(beam.area(), flat + (4.0 - std::numbers::pi) * 25.0, 0.2);
    EXPECT_NEAR(beam.profile_width(), 160.0, 1e-9);
    EXPECT_DOUBLE_EQ(beam.web_height(), 300.0 - 10.0 - 12.0 - 10.0);
    EXPECT_DOUBLE_EQ(beam.width_outstand_top_flange(), 41.0);
    EXPECT_DOUBLE_EQ(beam.width_outstand_bottom_flange(), 71.0);
    EXPECT_DOUBLE_EQ(beam.max_profile_thickness(), 12.0);
}

TEST(IProfileTest, RejectsFilletWiderThanFlange) {
    EXPECT_THROW(IProfile({.top_flange_width = 20.0, .top_flange_thickness = 5.0,
                           .bottom_flange_width = 20.0, .bottom_flange_thickness = 5.0,
                           .total_height = 100.0, .web_thickness = 6.0,
                           .top_radius = 8.0, .bottom_radius = 0.0}),
                 NegativeValueError);
}

// ============================================
// Cornered
// ============================================

TEST(CorneredProfileTest, QuarterAnnulus) {
    CorneredProfile corner({.thickness_vertical = 5.0, .thickness_horizontal = 5.0,
                            .inner_radius = 10.0, .outer_radius = 15.0});
    EXPECT_NEAR(corner.area(), std::numbers::pi / 4.0 * (225.0 - 100.0), 0.5);
    EXPECT_NEAR(corner.total_width(), 15.0, 1e-9);
    EXPECT_NEAR(corner.total_height(), 15.0, 1e-9);
    EXPECT_EQ(corner.family(), "Cornered");
    EXPECT_EQ(corner.name(), "Corner");
}

TEST(CorneredProfileTest, SmallOuterRadiusExtendsLegs) {
    CorneredProfile corner({.thickness_vertical = 5.0, .thickness_horizontal = 5.0,
                            .inner_radius = 10.0, .outer_radius = 5.0});
    EXPECT_NEAR(corner.total_width(), 15.0, 1e-9);
    EXPECT_NEAR(corner.total_height(), 15.0, 1e-9);
    EXPECT_NEAR(corner.area(), 141.2, 0.5);
    EXPECT_TRUE(ring::is_simple(corner.polygon().outer()));
}

TEST(CorneredProfileTest, DirectionAndReferencePoint) {
    CorneredDimensions d{.thickness_vertical = 5.0, .thickness_horizontal = 5.0,
                         .inner_radius = 10.0, .outer_radius = 15.0,
                         .x = 100.0, .y = 50.0};
    Bounds base = CorneredProfile(d).local_polygon().bounds();
    EXPECT_NEAR(base.min_x, 100.0, 1e-9);
    EXPECT_NEAR(base.min_y, 50.0, 1e-9);

    d.corner_direction = 2;
    Bounds flipped = CorneredProfile(d).local_polygon().bounds();
    EXPECT_NEAR(flipped.max_x, 100.0, 1e-9);
    EXPECT_NEAR(flipped.max_y, 50.0, 1e-9);

    d.corner_direction = 0;
    d.reference_point = "outer";
    Bounds outer = CorneredProfile(d).local_polygon().bounds();
    EXPECT_NEAR(outer.max_x, 100.0, 1e-9);
    EXPECT_NEAR(outer.max_y, 50.0, 1e-9);
}

TEST(CorneredProfileTest, RejectsInvalidParameters) {
    CorneredDimensions d{.thickness_vertical = 5.0, .thickness_horizontal = 5.0,
                         .inner_radius = 10.0, .outer_radius = 15.0};

    CorneredDimensions bad_direction = d;
    bad_direction.corner_direction = 4;
    EXPECT_THROW(CorneredProfile{bad_direction}, ValidationError);

    CorneredDimensions bad_reference = d;
    bad_reference.reference_point = "centroid";
    EXPECT_THROW(CorneredProfile{bad_reference}, ValidationError);

    CorneredDimensions steep = d;
    steep.outer_slope_at_vertical = 100.0;
    EXPECT_THROW(CorneredProfile{steep}, ValidationError);

    CorneredDimensions oversized = d;
    oversized.outer_radius = 15.5;
    EXPECT_THROW(CorneredProfile{oversized}, ValidationError);

    CorneredDimensions negative = d;
    negative.inner_radius = -1.0;
    EXPECT_THROW(CorneredProfile{negative}, NegativeValueError);
}

// ============================================
// Annular sector
// ============================================

TEST(AnnularSectorProfileTest, QuarterRing) {
    AnnularSectorProfile sector({.inner_radius = 10.0, .thickness = 5.0,
                                 .start_angle = 0.0, .end_angle = 90.0});
    EXPECT_NEAR(sector.area(), std::numbers::pi / 4.0 * (225.0 - 100.0), 0.05);
    // Compass angles: 0 points up, 90 points right
    Bounds b = sector.polygon().bounds();
    EXPECT_NEAR(b.min_x, 0.0, 1e-9);
    EXPECT_NEAR(b.min_y, 0.0, 1e-9);
    EXPECT_NEAR(b.max_x, 15.0, 1e-9);
    EXPECT_NEAR(b.max_y, 15.0, 1e-9);
}

TEST(AnnularSectorProfileTest, SolidWedgeAndOffset) {
    AnnularSectorProfile wedge({.inner_radius = 0.0, .thickness = 10.0,
                                .start_angle = -45.0, .end_angle = 45.0,
                                .x = 3.0, .y = 4.0});
    EXPECT_NEAR(wedge.area(), std::numbers::pi * 100.0 / 4.0, 0.05);
    Bounds b = wedge.polygon().bounds();
    EXPECT_NEAR(b.min_y, 4.0, 1e-9);
    EXPECT_NEAR(b.max_y, 14.0, 1e-9);
}

TEST(AnnularSectorProfileTest, RejectsInvalidAngles) {
    EXPECT_THROW(AnnularSectorProfile({.inner_radius = 1.0, .thickness = 1.0,
                                       .start_angle = 10.0, .end_angle = 10.0}),
                 ValidationError);
    EXPECT_THROW(AnnularSectorProfile({.inner_radius = 1.0, .thickness = 1.0,
                                       .start_angle = 0.0, .end_angle = 360.0}),
                 ValidationError);
    EXPECT_THROW(AnnularSectorProfile({.inner_radius = 1.0, .thickness = 1.0,
                                       .start_angle = -400.0, .end_angle = 0.0}),
                 ValidationError);
    EXPECT_THROW(AnnularSectorProfile({.inner_radius = 1.0, .thickness = 0.0,
                                       .start_angle = 0.0, .end_angle = 90.0}),
                 NonPositiveValueError);
}

// ============================================
// Placement
// ============================================

TEST(PlacementTest, OffsetsMoveCentroid) {
    StripProfile strip({.width = 20.0, .height = 10.0}, "Strip",
                       {.horizontal_offset = 5.0, .vertical_offset = -3.0});
    EXPECT_NEAR(strip.centroid().x, 5.0, 1e-12);
    EXPECT_NEAR(strip.centroid().y, -3.0, 1e-12);
    EXPECT_NEAR(strip.local_polygon().centroid().x, 0.0, 1e-12);
}

TEST(PlacementTest, RotationIsAboutCentroid) {
    StripProfile strip({.width = 20.0, .height = 10.0}, "Strip", {.rotation = 90.0});
    EXPECT_NEAR(strip.profile_width(), 10.0, 1e-9);
    EXPECT_NEAR(strip.profile_height(), 20.0, 1e-9);
    EXPECT_NEAR(strip.centroid().x, 0.0, 1e-9);
    EXPECT_NEAR(strip.area(), 200.0, 1e-9);
}

TEST(PlacementTest, TransformAccumulates) {
    auto strip = std::make_shared<StripProfile>(StripDimensions{.width = 20.0, .height = 10.0});
    auto moved = strip->transform(10.0, 0.0)->transform(0.0, 5.0, 30.0);
    EXPECT_DOUBLE_EQ(moved->placement().horizontal_offset, 10.0);
    EXPECT_DOUBLE_EQ(moved->placement().vertical_offset, 5.0);
    EXPECT_DOUBLE_EQ(moved->placement().rotation, 30.0);
    EXPECT_NEAR(moved->centroid().x, 10.0, 1e-9);
    EXPECT_NEAR(moved->centroid().y, 5.0, 1e-9);
    EXPECT_EQ(moved->name(), strip->name());
    // Source is untouched
    EXPECT_DOUBLE_EQ(strip->placement().horizontal_offset, 0.0);
}
