#include "profile_json.hpp"
#include <catalog/standard_profiles.hpp>
#include <common/errors.hpp>
#include <common/logging.hpp>

namespace sectionpath {

// CHS
void to_json(nlohmann::json& j, const CHSDimensions& d) {
    j = {
        {"outer_diameter", d.outer_diameter},
        {"wall_thickness", d.wall_thickness}
    };
}

void from_json(const nlohmann::json& j, CHSDimensions& d) {
    d.outer_diameter = j.at("outer_diameter").get<double>();
    d.wall_thickness = j.at("wall_thickness").get<double>();
}

// RHS / SHS
void to_json(nlohmann::json& j, const RHSDimensions& d) {
    j = {
        {"total_width", d.total_width},
        {"total_height", d.total_height},
        {"left_wall_thickness", d.left_wall_thickness},
        {"right_wall_thickness", d.right_wall_thickness},
        {"top_wall_thickness", d.top_wall_thickness},
        {"bottom_wall_thickness", d.bottom_wall_thickness},
        {"top_right_outer_radius", d.top_right_outer_radius},
        {"top_left_outer_radius", d.top_left_outer_radius},
        {"bottom_right_outer_radius", d.bottom_right_outer_radius},
        {"bottom_left_outer_radius", d.bottom_left_outer_radius},
        {"top_right_inner_radius", d.top_right_inner_radius},
        {"top_left_inner_radius", d.top_left_inner_radius},
        {"bottom_right_inner_radius", d.bottom_right_inner_radius},
        {"bottom_left_inner_radius", d.bottom_left_inner_radius}
    };
}

// "thickness", "outer_radius" and "inner_radius" set all four walls or
// corners; per-side keys override them
void from_json(const nlohmann::json& j, RHSDimensions& d) {
    RHSDimensions base = RHSDimensions::uniform(
        j.at("total_width").get<double>(),
        j.at("total_height").get<double>(),
        j.value("thickness", 0.0),
        j.value("outer_radius", 0.0),
        j.value("inner_radius", 0.0));

    d.total_width = base.total_width;
    d.total_height = base.total_height;
    d.left_wall_thickness = j.value("left_wall_thickness", base.left_wall_thickness);
    d.right_wall_thickness = j.value("right_wall_thickness", base.right_wall_thickness);
    d.top_wall_thickness = j.value("top_wall_thickness", base.top_wall_thickness);
    d.bottom_wall_thickness = j.value("bottom_wall_thickness", base.bottom_wall_thickness);
    d.top_right_outer_radius = j.value("top_right_outer_radius", base.top_right_outer_radius);
    d.top_left_outer_radius = j.value("top_left_outer_radius", base.top_left_outer_radius);
    d.bottom_right_outer_radius = j.value("bottom_right_outer_radius", base.bottom_right_outer_radius);
    d.bottom_left_outer_radius = j.value("bottom_left_outer_radius", base.bottom_left_outer_radius);
    d.top_right_inner_radius = j.value("top_right_inner_radius", base.top_right_inner_radius);
    d.top_left_inner_radius = j.value("top_left_inner_radius", base.top_left_inner_radius);
    d.bottom_right_inner_radius = j.value("bottom_right_inner_radius", base.bottom_right_inner_radius);
    d.bottom_left_inner_radius = j.value("bottom_left_inner_radius", base.bottom_left_inner_radius);
}

// LNP
void to_json(nlohmann::json& j, const LNPDimensions& d) {
    j = {
        {"total_height", d.total_height},
        {"total_width", d.total_width},
        {"web_thickness", d.web_thickness},
        {"base_thickness", d.base_thickness},
        {"root_radius", d.root_radius},
        {"back_radius", d.back_radius},
        {"web_toe_radius", d.web_toe_radius},
        {"base_toe_radius", d.base_toe_radius}
    };
}

void from_json(const nlohmann::json& j, LNPDimensions& d) {
    d.total_height = j.at("total_height").get<double>();
    d.total_width = j.at("total_width").get<double>();
    d.web_thickness = j.at("web_thickness").get<double>();
    d.base_thickness = j.at("base_thickness").get<double>();
    d.root_radius = j.value("root_radius", 0.0);
    d.back_radius = j.value("back_radius", 0.0);
    d.web_toe_radius = j.value("web_toe_radius", 0.0);
    d.base_toe_radius = j.value("base_toe_radius", 0.0);
}

// UNP
void to_json(nlohmann::json& j, const UNPDimensions& d) {
    j = {
        {"top_flange_total_width", d.top_flange_total_width},
        {"top_flange_thickness", d.top_flange_thickness},
        {"bottom_flange_total_width", d.bottom_flange_total_width},
        {"bottom_flange_thickness", d.bottom_flange_thickness},
        {"total_height", d.total_height},
        {"web_thickness", d.web_thickness},
        {"top_root_fillet_radius", d.top_root_fillet_radius},
        {"top_toe_radius", d.top_toe_radius},
        {"top_outer_corner_radius", d.top_outer_corner_radius},
        {"bottom_root_fillet_radius", d.bottom_root_fillet_radius},
        {"bottom_toe_radius", d.bottom_toe_radius},
        {"bottom_outer_corner_radius", d.bottom_outer_corner_radius},
        {"top_slope", d.top_slope},
        {"bottom_slope", d.bottom_slope}
    };
}

void from_json(const nlohmann::json& j, UNPDimensions& d) {
    d.top_flange_total_width = j.at("top_flange_total_width").get<double>();
    d.top_flange_thickness = j.at("top_flange_thickness").get<double>();
    d.bottom_flange_total_width = j.value("bottom_flange_total_width", d.top_flange_total_width);
    d.bottom_flange_thickness = j.value("bottom_flange_thickness", d.top_flange_thickness);
    d.total_height = j.at("total_height").get<double>();
    d.web_thickness = j.at("web_thickness").get<double>();
    d.top_root_fillet_radius = j.value("top_root_fillet_radius", 0.0);
    d.top_toe_radius = j.value("top_toe_radius", 0.0);
    d.top_outer_corner_radius = j.value("top_outer_corner_radius", 0.0);
    d.bottom_root_fillet_radius = j.value("bottom_root_fillet_radius", d.top_root_fillet_radius);
    d.bottom_toe_radius = j.value("bottom_toe_radius", d.top_toe_radius);
    d.bottom_outer_corner_radius = j.value("bottom_outer_corner_radius", d.top_outer_corner_radius);
    d.top_slope = j.value("top_slope", 0.0);
    d.bottom_slope = j.value("bottom_slope", d.top_slope);
}

// Strip
void to_json(nlohmann::json& j, const StripDimensions& d) {
    j = {{"width", d.width}, {"height", d.height}};
}

void from_json(const nlohmann::json& j, StripDimensions& d) {
    d.width = j.at("width").get<double>();
    d.height = j.at("height").get<double>();
}

// I
void to_json(nlohmann::json& j, const IDimensions& d) {
    j = {
        {"top_flange_width", d.top_flange_width},
        {"top_flange_thickness", d.top_flange_thickness},
        {"bottom_flange_width", d.bottom_flange_width},
        {"bottom_flange_thickness", d.bottom_flange_thickness},
        {"total_height", d.total_height},
        {"web_thickness", d.web_thickness},
        {"top_radius", d.top_radius},
        {"bottom_radius", d.bottom_radius}
    };
}

void from_json(const nlohmann::json& j, IDimensions& d) {
    d.top_flange_width = j.at("top_flange_width").get<double>();
    d.top_flange_thickness = j.at("top_flange_thickness").get<double>();
    d.bottom_flange_width = j.value("bottom_flange_width", d.top_flange_width);
    d.bottom_flange_thickness = j.value("bottom_flange_thickness", d.top_flange_thickness);
    d.total_height = j.at("total_height").get<double>();
    d.web_thickness = j.at("web_thickness").get<double>();
    d.top_radius = j.value("top_radius", 0.0);
    d.bottom_radius = j.value("bottom_radius", d.top_radius);
}

// Cornered
void to_json(nlohmann::json& j, const CorneredDimensions& d) {
    j = {
        {"thickness_vertical", d.thickness_vertical},
        {"thickness_horizontal", d.thickness_horizontal},
        {"inner_radius", d.inner_radius},
        {"outer_radius", d.outer_radius},
        {"corner_direction", d.corner_direction},
        {"inner_slope_at_vertical", d.inner_slope_at_vertical},
        {"inner_slope_at_horizontal", d.inner_slope_at_horizontal},
        {"outer_slope_at_vertical", d.outer_slope_at_vertical},
        {"outer_slope_at_horizontal", d.outer_slope_at_horizontal},
        {"reference_point", d.reference_point},
        {"x", d.x},
        {"y", d.y}
    };
}

void from_json(const nlohmann::json& j, CorneredDimensions& d) {
    d.thickness_vertical = j.at("thickness_vertical").get<double>();
    d.thickness_horizontal = j.at("thickness_horizontal").get<double>();
    d.inner_radius = j.at("inner_radius").get<double>();
    d.outer_radius = j.at("outer_radius").get<double>();
    d.corner_direction = j.value("corner_direction", 0);
    d.inner_slope_at_vertical = j.value("inner_slope_at_vertical", 0.0);
    d.inner_slope_at_horizontal = j.value("inner_slope_at_horizontal", 0.0);
    d.outer_slope_at_vertical = j.value("outer_slope_at_vertical", 0.0);
    d.outer_slope_at_horizontal = j.value("outer_slope_at_horizontal", 0.0);
    d.reference_point = j.value("reference_point", std::string("intersection"));
    d.x = j.value("x", 0.0);
    d.y = j.value("y", 0.0);
}

// Annular sector
void to_json(nlohmann::json& j, const AnnularSectorDimensions& d) {
    j = {
        {"inner_radius", d.inner_radius},
        {"thickness", d.thickness},
        {"start_angle", d.start_angle},
        {"end_angle", d.end_angle},
        {"x", d.x},
        {"y", d.y}
    };
}

void from_json(const nlohmann::json& j, AnnularSectorDimensions& d) {
    d.inner_radius = j.at("inner_radius").get<double>();
    d.thickness = j.at("thickness").get<double>();
    d.start_angle = j.at("start_angle").get<double>();
    d.end_angle = j.at("end_angle").get<double>();
    d.x = j.value("x", 0.0);
    d.y = j.value("y", 0.0);
}

namespace json {

namespace {

template <typename ProfileT, typename Dimensions>
std::shared_ptr<const Profile> build(const nlohmann::json& j, const std::string& default_name,
                                     const Placement& placement) {
    Dimensions dims = j.at("dimensions").get<Dimensions>();
    return std::make_shared<ProfileT>(dims, j.value("name", default_name), placement);
}

std::shared_ptr<const Profile> build_family(const nlohmann::json& j, const Placement& placement) {
    std::string family = catalog::normalize_key(j.at("family").get<std::string>());

    if (family == "CHS") return build<CHSProfile, CHSDimensions>(j, "CHS", placement);
    if (family == "RHS") return build<RHSProfile, RHSDimensions>(j, "RHS", placement);
    if (family == "SHS") return build<RHSProfile, RHSDimensions>(j, "SHS", placement);
    if (family == "LNP") return build<LNPProfile, LNPDimensions>(j, "LNP", placement);
    if (family == "UNP") return build<UNPProfile, UNPDimensions>(j, "UNP", placement);
    if (family == "STRIP") return build<StripProfile, StripDimensions>(j, "Strip", placement);
    if (family == "I") return build<IProfile, IDimensions>(j, "I-Profile", placement);
    if (family == "CORNERED") return build<CorneredProfile, CorneredDimensions>(j, "Corner", placement);
    if (family == "ANNULARSECTOR") {
        return build<AnnularSectorProfile, AnnularSectorDimensions>(j, "Annular Sector", placement);
    }
    throw ValidationError("Unknown profile family: " + j.at("family").get<std::string>());
}

nlohmann::json dimensions_to_json(const Profile& profile) {
    if (auto* p = dynamic_cast<const CHSProfile*>(&profile)) return p->dimensions();
    if (auto* p = dynamic_cast<const RHSProfile*>(&profile)) return p->dimensions();
    if (auto* p = dynamic_cast<const LNPProfile*>(&profile)) return p->dimensions();
    if (auto* p = dynamic_cast<const UNPProfile*>(&profile)) return p->dimensions();
    if (auto* p = dynamic_cast<const StripProfile*>(&profile)) return p->dimensions();
    if (auto* p = dynamic_cast<const IProfile*>(&profile)) return p->dimensions();
    if (auto* p = dynamic_cast<const CorneredProfile*>(&profile)) return p->dimensions();
    if (auto* p = dynamic_cast<const AnnularSectorProfile*>(&profile)) return p->dimensions();
    throw std::runtime_error("No serializer for profile family " + profile.family());
}

}  // namespace

std::shared_ptr<const Profile> profile_from_json(const nlohmann::json& j) {
    auto log = logging::get_logger();

    Placement placement = j.value("placement", Placement{});

    std::shared_ptr<const Profile> profile;
    if (j.contains("standard")) {
        profile = catalog::from_standard(j.at("standard").get<std::string>());
        if (j.contains("placement")) {
            profile = profile->with_placement(placement);
        }
    } else if (j.contains("family")) {
        profile = build_family(j, placement);
    } else {
        throw ValidationError("Profile definition needs either 'standard' or 'family'");
    }

    if (j.contains("corrosion")) {
        HollowCorrosion loss = j.at("corrosion").get<HollowCorrosion>();
        profile = with_corrosion(profile, loss);
    }

    log->debug("Loaded profile '{}' ({})", profile->name(), profile->family());
    return profile;
}

nlohmann::json profile_to_json(const Profile& profile) {
    return {
        {"family", profile.family()},
        {"name", profile.name()},
        {"dimensions", dimensions_to_json(profile)},
        {"placement", profile.placement()}
    };
}

nlohmann::json profile_summary_to_json(const Profile& profile) {
    return {
        {"name", profile.name()},
        {"family", profile.family()},
        {"area", profile.area()},
        {"perimeter", profile.perimeter()},
        {"centroid", profile.centroid()},
        {"profile_width", profile.profile_width()},
        {"profile_height", profile.profile_height()},
        {"max_profile_thickness", profile.max_profile_thickness()},
        {"volume_per_meter", profile.volume_per_meter()},
        {"bounds", profile.polygon().bounds()},
        {"polygon", profile.polygon()}
    };
}

SectionRecord section_record(const Profile& profile) {
    const ClosedPolygon& polygon = profile.polygon();
    SectionRecord record;
    record.definition = profile_to_json(profile);
    record.standard = catalog::find_key(corrosion::parse_name(profile.name()).base_name);
    record.summary = profile_summary_to_json(profile);
    record.vertex_count = polygon.vertex_count();
    record.hole_count = polygon.holes().size();
    return record;
}

SectionDocument export_profile(const Profile& profile, const std::string& source_file) {
    SectionDocument document;
    document.created_at = utc_timestamp();
    document.source_file = source_file;
    document.sections.push_back(section_record(profile));
    return document;
}

SectionDocument export_profiles(const std::vector<std::shared_ptr<const Profile>>& profiles,
                                const std::string& source_file) {
    SectionDocument document;
    document.created_at = utc_timestamp();
    document.source_file = source_file;
    document.sections.reserve(profiles.size());
    for (const auto& profile : profiles) {
        document.sections.push_back(section_record(*profile));
    }
    return document;
}

std::vector<std::shared_ptr<const Profile>> profiles_from_document(const SectionDocument& document) {
    std::vector<std::shared_ptr<const Profile>> profiles;
    profiles.reserve(document.sections.size());
    for (const auto& record : document.sections) {
        profiles.push_back(profile_from_json(record.definition));
    }
    return profiles;
}

std::vector<std::shared_ptr<const Profile>> load_profiles(const std::string& path) {
    nlohmann::json doc = read_json_file(path);

    std::vector<std::shared_ptr<const Profile>> profiles;
    if (is_section_document(doc)) {
        profiles = profiles_from_document(doc.get<SectionDocument>());
    } else if (doc.is_array()) {
        profiles.reserve(doc.size());
        for (const auto& entry : doc) {
            profiles.push_back(profile_from_json(entry));
        }
    } else {
        profiles.push_back(profile_from_json(doc));
    }

    logging::get_logger()->info("Loaded {} profile(s) from {}", profiles.size(), path);
    return profiles;
}

}  // namespace json

}  // namespace sectionpath
