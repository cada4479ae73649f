#ifndef SECTIONPATH_SERIALIZATION_PROFILE_JSON_HPP
#define SECTIONPATH_SERIALIZATION_PROFILE_JSON_HPP

#include <nlohmann/json.hpp>
#include "section_document.hpp"
#include <math/vec2.hpp>
#include <geometry/polygon.hpp>
#include <profiles/profiles.hpp>
#include <corrosion/corrosion.hpp>
#include <memory>
#include <string>
#include <vector>

namespace sectionpath {

// Vec2 serialization
inline void to_json(nlohmann::json& j, const Vec2& v) {
    j = nlohmann::json::array({v.x, v.y});
}

inline void from_json(const nlohmann::json& j, Vec2& v) {
    v.x = j.at(0).get<double>();
    v.y = j.at(1).get<double>();
}

// Placement serialization
inline void to_json(nlohmann::json& j, const Placement& p) {
    j = {
        {"horizontal_offset", p.horizontal_offset},
        {"vertical_offset", p.vertical_offset},
        {"rotation", p.rotation}
    };
}

inline void from_json(const nlohmann::json& j, Placement& p) {
    p.horizontal_offset = j.value("horizontal_offset", 0.0);
    p.vertical_offset = j.value("vertical_offset", 0.0);
    p.rotation = j.value("rotation", 0.0);
}

// Corrosion serialization
inline void to_json(nlohmann::json& j, const UniformCorrosion& c) {
    j = {{"corrosion", c.corrosion}};
}

inline void from_json(const nlohmann::json& j, UniformCorrosion& c) {
    c.corrosion = j.is_number() ? j.get<double>() : j.value("corrosion", 0.0);
}

inline void to_json(nlohmann::json& j, const HollowCorrosion& c) {
    j = {{"outside", c.outside}, {"inside", c.inside}};
}

// Accepts {"outside": o, "inside": i}, {"corrosion": c} or a bare number;
// the uniform forms corrode the outside only
inline void from_json(const nlohmann::json& j, HollowCorrosion& c) {
    if (j.is_number()) {
        c.outside = j.get<double>();
        c.inside = 0.0;
        return;
    }
    c.outside = j.value("outside", j.value("corrosion", 0.0));
    c.inside = j.value("inside", 0.0);
}

// Geometry output
inline void to_json(nlohmann::json& j, const Bounds& b) {
    j = {
        {"min_x", b.min_x},
        {"min_y", b.min_y},
        {"max_x", b.max_x},
        {"max_y", b.max_y}
    };
}

inline void to_json(nlohmann::json& j, const ClosedPolygon& polygon) {
    j = {
        {"outer", polygon.outer()},
        {"holes", polygon.holes()}
    };
}

// Dimension structs
void to_json(nlohmann::json& j, const CHSDimensions& d);
void from_json(const nlohmann::json& j, CHSDimensions& d);
void to_json(nlohmann::json& j, const RHSDimensions& d);
void from_json(const nlohmann::json& j, RHSDimensions& d);
void to_json(nlohmann::json& j, const LNPDimensions& d);
void from_json(const nlohmann::json& j, LNPDimensions& d);
void to_json(nlohmann::json& j, const UNPDimensions& d);
void from_json(const nlohmann::json& j, UNPDimensions& d);
void to_json(nlohmann::json& j, const StripDimensions& d);
void from_json(const nlohmann::json& j, StripDimensions& d);
void to_json(nlohmann::json& j, const IDimensions& d);
void from_json(const nlohmann::json& j, IDimensions& d);
void to_json(nlohmann::json& j, const CorneredDimensions& d);
void from_json(const nlohmann::json& j, CorneredDimensions& d);
void to_json(nlohmann::json& j, const AnnularSectorDimensions& d);
void from_json(const nlohmann::json& j, AnnularSectorDimensions& d);

namespace json {

// Builds a profile from a definition document:
//   {"standard": "RHS200x100x5", "placement": {...}, "corrosion": {...}}
//   {"family": "LNP", "name": "L 60x40", "dimensions": {...}, "placement": {...}}
std::shared_ptr<const Profile> profile_from_json(const nlohmann::json& j);

// Definition document that profile_from_json reads back into an equal profile
nlohmann::json profile_to_json(const Profile& profile);

// Name, derived section values and the placed boundary
nlohmann::json profile_summary_to_json(const Profile& profile);

// Definition, catalog reference and summary of one profile
SectionRecord section_record(const Profile& profile);

SectionDocument export_profile(const Profile& profile, const std::string& source_file = "");
SectionDocument export_profiles(const std::vector<std::shared_ptr<const Profile>>& profiles,
                                const std::string& source_file = "");

// Rebuilds every section of an exported document from its definition
std::vector<std::shared_ptr<const Profile>> profiles_from_document(const SectionDocument& document);

// Reads a file holding one definition, an array of definitions or an
// exported section document
std::vector<std::shared_ptr<const Profile>> load_profiles(const std::string& path);

}  // namespace json

}  // namespace sectionpath

#endif // SECTIONPATH_SERIALIZATION_PROFILE_JSON_HPP
