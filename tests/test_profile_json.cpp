#include <gtest/gtest.h>
#include "profile_json.hpp"
#include "errors.hpp"
#include "standard_profiles.hpp"
#include <filesystem>
#include <fstream>
#include <string>

using namespace sectionpath;

namespace {

std::string temp_path(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

}  // namespace

TEST(ProfileJsonTest, DimensionsRoundTrip) {
    UNPDimensions d{
        .top_flange_total_width = 75.0,
        .top_flange_thickness = 11.5,
        .bottom_flange_total_width = 80.0,
        .bottom_flange_thickness = 12.0,
        .total_height = 200.0,
        .web_thickness = 8.5,
        .top_root_fillet_radius = 11.5,
        .top_toe_radius = 6.0,
        .bottom_root_fillet_radius = 10.0,
        .bottom_toe_radius = 5.0,
        .top_slope = 8.0,
        .bottom_slope = 5.0
    };
    nlohmann::json j = d;
    UNPDimensions back = j.get<UNPDimensions>();
    EXPECT_DOUBLE_EQ(back.bottom_flange_total_width, 80.0);
    EXPECT_DOUBLE_EQ(back.bottom_toe_radius, 5.0);
    EXPECT_DOUBLE_EQ(back.bottom_slope, 5.0);
}

TEST(ProfileJsonTest, UNPBottomDefaultsToTop) {
    nlohmann::json j = {
        {"top_flange_total_width", 75.0},
        {"top_flange_thickness", 11.5},
        {"total_height", 200.0},
        {"web_thickness", 8.5},
        {"top_root_fillet_radius", 11.5},
        {"top_toe_radius", 6.0},
        {"top_slope", 8.0}
    };
    UNPDimensions d = j.get<UNPDimensions>();
    EXPECT_DOUBLE_EQ(d.bottom_flange_total_width, 75.0);
    EXPECT_DOUBLE_EQ(d.bottom_root_fillet_radius, 11.5);
    EXPECT_DOUBLE_EQ(d.bottom_slope, 8.0);
    EXPECT_DOUBLE_EQ(d.top_outer_corner_radius, 0.0);
}

TEST(ProfileJsonTest, RHSUniformShorthand) {
    nlohmann::json j = {
        {"total_width", 100.0},
        {"total_height", 200.0},
        {"thickness", 5.0},
        {"outer_radius", 7.5},
        {"inner_radius", 5.0},
        {"left_wall_thickness", 8.0}
    };
    RHSDimensions d = j.get<RHSDimensions>();
    EXPECT_DOUBLE_EQ(d.left_wall_thickness, 8.0);
    EXPECT_DOUBLE_EQ(d.right_wall_thickness, 5.0);
    EXPECT_DOUBLE_EQ(d.bottom_left_outer_radius, 7.5);
    EXPECT_DOUBLE_EQ(d.top_right_inner_radius, 5.0);
}

TEST(ProfileJsonTest, MissingRequiredKeyThrows) {
    nlohmann::json j = {{"outer_diameter", 100.0}};
    EXPECT_THROW(j.get<CHSDimensions>(), nlohmann::json::out_of_range);
}

TEST(ProfileJsonTest, CorrosionForms) {
    HollowCorrosion bare = nlohmann::json(1.5).get<HollowCorrosion>();
    EXPECT_DOUBLE_EQ(bare.outside, 1.5);
    EXPECT_DOUBLE_EQ(bare.inside, 0.0);

    HollowCorrosion uniform = nlohmann::json{{"corrosion", 2.0}}.get<HollowCorrosion>();
    EXPECT_DOUBLE_EQ(uniform.outside, 2.0);

    HollowCorrosion hollow = nlohmann::json{{"outside", 1.0}, {"inside", 0.5}}.get<HollowCorrosion>();
    EXPECT_DOUBLE_EQ(hollow.outside, 1.0);
    EXPECT_DOUBLE_EQ(hollow.inside, 0.5);
}

TEST(ProfileJsonTest, StandardDefinition) {
    nlohmann::json j = {
        {"standard", "RHS200x100x5"},
        {"placement", {{"horizontal_offset", 10.0}}},
        {"corrosion", {{"outside", 1.0}, {"inside", 0.5}}}
    };
    auto profile = json::profile_from_json(j);
    EXPECT_EQ(profile->family(), "RHS");
    EXPECT_EQ(profile->name(), "RHS200x100x5 (corrosion inside: 0.5 mm, outside: 1.0 mm)");
    EXPECT_DOUBLE_EQ(profile->placement().horizontal_offset, 10.0);
    EXPECT_NEAR(profile->profile_width(), 98.0, 1e-9);
    EXPECT_NEAR(profile->centroid().x, 10.0, 1e-9);
}

TEST(ProfileJsonTest, FamilyDefinition) {
    nlohmann::json j = {
        {"family", "strip"},
        {"name", "Flat 40x5"},
        {"dimensions", {{"width", 40.0}, {"height", 5.0}}},
        {"corrosion", 0.5}
    };
    auto profile = json::profile_from_json(j);
    EXPECT_EQ(profile->family(), "Strip");
    EXPECT_EQ(profile->name(), "Flat 40x5 (corrosion: 0.5 mm)");
    EXPECT_NEAR(profile->area(), 39.0 * 4.0, 1e-9);
}

TEST(ProfileJsonTest, AnnularSectorAndCornerFamilies) {
    auto sector = json::profile_from_json({
        {"family", "AnnularSector"},
        {"dimensions", {{"inner_radius", 10.0}, {"thickness", 5.0},
                        {"start_angle", 0.0}, {"end_angle", 90.0}}}
    });
    EXPECT_EQ(sector->name(), "Annular Sector");

    auto corner = json::profile_from_json({
        {"family", "Cornered"},
        {"dimensions", {{"thickness_vertical", 5.0}, {"thickness_horizontal", 5.0},
                        {"inner_radius", 10.0}, {"outer_radius", 15.0},
                        {"corner_direction", 1}}}
    });
    EXPECT_EQ(corner->family(), "Cornered");
    EXPECT_LE(corner->polygon().bounds().max_x, 1e-9);
}

TEST(ProfileJsonTest, RejectsUnknownDefinitions) {
    EXPECT_THROW(json::profile_from_json({{"family", "HEA"}, {"dimensions", nlohmann::json::object()}}),
                 ValidationError);
    EXPECT_THROW(json::profile_from_json({{"name", "nothing"}}), ValidationError);
    EXPECT_THROW(json::profile_from_json({{"standard", "HEB300"}}), ProfileNotFoundError);
}

TEST(ProfileJsonTest, DefinitionRoundTrip) {
    auto original = std::make_shared<IProfile>(
        IDimensions{.top_flange_width = 100.0, .top_flange_thickness = 8.5,
                    .bottom_flange_width = 100.0, .bottom_flange_thickness = 8.5,
                    .total_height = 200.0, .web_thickness = 5.6,
                    .top_radius = 12.0, .bottom_radius = 12.0},
        "IPE200", Placement{.rotation = 45.0});
    nlohmann::json j = json::profile_to_json(*original);
    EXPECT_EQ(j["family"], "I");

    auto restored = json::profile_from_json(j);
    EXPECT_EQ(restored->name(), "IPE200");
    EXPECT_DOUBLE_EQ(restored->placement().rotation, 45.0);
    EXPECT_DOUBLE_EQ(restored->area(), original->area());
}

TEST(ProfileJsonTest, Summary) {
    StripProfile strip({.width = 20.0, .height = 10.0}, "20x10");
    nlohmann::json j = json::profile_summary_to_json(strip);
    EXPECT_EQ(j["name"], "20x10");
    EXPECT_NEAR(j["area"].get<double>(), 200.0, 1e-9);
    EXPECT_NEAR(j["bounds"]["max_x"].get<double>(), 10.0, 1e-9);
    EXPECT_EQ(j["polygon"]["outer"].size(), 4u);
    EXPECT_TRUE(j["polygon"]["holes"].empty());
}

TEST(ProfileJsonTest, ExportDocument) {
    auto chs = std::make_shared<CHSProfile>(CHSDimensions{.outer_diameter = 60.3, .wall_thickness = 4.0});
    json::SectionDocument document = json::export_profile(*chs, "frame.json");
    EXPECT_EQ(document.version, json::SECTION_DOCUMENT_VERSION);
    EXPECT_EQ(document.units, "mm");
    EXPECT_EQ(document.source_file, "frame.json");
    EXPECT_FALSE(document.created_at.empty());
    ASSERT_EQ(document.sections.size(), 1u);
    EXPECT_EQ(document.sections[0].hole_count, 1u);
    EXPECT_EQ(document.sections[0].vertex_count, chs->polygon().vertex_count());
    EXPECT_FALSE(document.sections[0].standard.has_value());

    std::string path = temp_path("sectionpath_export_test.json");
    json::write_document(path, document);
    json::SectionDocument back = json::read_document(path);
    ASSERT_EQ(back.sections.size(), 1u);
    EXPECT_EQ(back.source_file, "frame.json");
    EXPECT_NEAR(back.sections[0].summary["area"].get<double>(), chs->area(), 1e-9);
    std::filesystem::remove(path);
}

TEST(ProfileJsonTest, ExportRecordsCatalogOrigin) {
    auto unp = with_corrosion(catalog::unp("UNP200"), UniformCorrosion{1.0});
    json::SectionRecord record = json::section_record(*unp);
    ASSERT_TRUE(record.standard.has_value());
    EXPECT_EQ(*record.standard, "UNP200");
    EXPECT_EQ(record.definition["name"], "UNP200 (corrosion: 1.0 mm)");

    nlohmann::json j = json::export_profile(*catalog::chs("CHS 21.3x2.3"));
    EXPECT_EQ(j["sections"][0]["standard"], "CHS21_3x2_3");
}

TEST(ProfileJsonTest, ExportedDocumentLoadsBack) {
    std::vector<std::shared_ptr<const Profile>> profiles = {
        catalog::unp("UNP120"),
        catalog::rhs("RHS200x100x5")->transform(10.0, -5.0, 30.0),
        std::make_shared<StripProfile>(StripDimensions{.width = 40.0, .height = 8.0}, "40x8")
    };
    std::string path = temp_path("sectionpath_roundtrip_test.json");
    json::write_document(path, json::export_profiles(profiles, "frame.json"));

    auto loaded = json::load_profiles(path);
    ASSERT_EQ(loaded.size(), profiles.size());
    for (size_t i = 0; i < profiles.size(); ++i) {
        EXPECT_EQ(loaded[i]->name(), profiles[i]->name());
        EXPECT_NEAR(loaded[i]->area(), profiles[i]->area(), 1e-9);
        EXPECT_NEAR(loaded[i]->centroid().x, profiles[i]->centroid().x, 1e-9);
    }
    std::filesystem::remove(path);
}

TEST(ProfileJsonTest, RejectsForeignDocuments) {
    nlohmann::json inches = {{"version", 1}, {"units", "in"}, {"sections", nlohmann::json::array()}};
    EXPECT_THROW(inches.get<json::SectionDocument>(), ValidationError);

    nlohmann::json future = {{"version", 99}, {"sections", nlohmann::json::array()}};
    EXPECT_THROW(future.get<json::SectionDocument>(), ValidationError);

    EXPECT_THROW(nlohmann::json::object().get<json::SectionDocument>(), ValidationError);
}

TEST(ProfileJsonTest, LoadProfilesFromFile) {
    std::string path = temp_path("sectionpath_load_test.json");
    json::write_json_file(path, nlohmann::json::array({
        {{"standard", "UNP200"}},
        {{"standard", "CHS 21.3x2.3"}, {"corrosion", {{"outside", 0.5}, {"inside", 0.0}}}},
        {{"family", "LNP"}, {"dimensions", {{"total_height", 50.0}, {"total_width", 50.0},
                                             {"web_thickness", 5.0}, {"base_thickness", 5.0}}}}
    }));

    auto profiles = json::load_profiles(path);
    ASSERT_EQ(profiles.size(), 3u);
    EXPECT_EQ(profiles[0]->name(), "UNP200");
    EXPECT_EQ(profiles[1]->name(), "CHS 21.3x2.3 (corrosion inside: 0.0 mm, outside: 0.5 mm)");
    EXPECT_NEAR(profiles[2]->area(), 475.0, 1e-9);
    std::filesystem::remove(path);
}

TEST(ProfileJsonTest, UnreadableFiles) {
    EXPECT_THROW(json::read_json_file(temp_path("sectionpath_missing_file.json")), std::runtime_error);

    std::string path = temp_path("sectionpath_broken_test.json");
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(json::read_json_file(path), std::runtime_error);
    std::filesystem::remove(path);
}
