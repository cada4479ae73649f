#include "standard_profiles.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cctype>

namespace sectionpath::catalog {

namespace {

// Column order: height, width, thickness (left, right, top, bottom),
// outer radius (top right, top left, bottom right, bottom left),
// inner radius (same corner order)
CatalogEntry<RHSDimensions> rhs_row(const char* name, double h, double w,
                                    double t_left, double t_right, double t_top, double t_bottom,
                                    double ro_tr, double ro_tl, double ro_br, double ro_bl,
                                    double ri_tr, double ri_tl, double ri_br, double ri_bl) {
    return {name, RHSDimensions{
        .total_width = w,
        .total_height = h,
        .left_wall_thickness = t_left,
        .right_wall_thickness = t_right,
        .top_wall_thickness = t_top,
        .bottom_wall_thickness = t_bottom,
        .top_right_outer_radius = ro_tr,
        .top_left_outer_radius = ro_tl,
        .bottom_right_outer_radius = ro_br,
        .bottom_left_outer_radius = ro_bl,
        .top_right_inner_radius = ri_tr,
        .top_left_inner_radius = ri_tl,
        .bottom_right_inner_radius = ri_br,
        .bottom_left_inner_radius = ri_bl
    }};
}

CatalogEntry<CHSDimensions> chs_row(const char* name, double d, double t) {
    return {name, CHSDimensions{.outer_diameter = d, .wall_thickness = t}};
}

// Column order: height, width, web, base, root, back, web toe, base toe
CatalogEntry<LNPDimensions> lnp_row(const char* name, double h, double w,
                                    double t_web, double t_base, double r_root,
                                    double r_back, double r_web_toe, double r_base_toe) {
    return {name, LNPDimensions{
        .total_height = h,
        .total_width = w,
        .web_thickness = t_web,
        .base_thickness = t_base,
        .root_radius = r_root,
        .back_radius = r_back,
        .web_toe_radius = r_web_toe,
        .base_toe_radius = r_base_toe
    }};
}

// EN 10279 channels: 8% flange slope, sharp outer corners
// Column order: h, b, tw, tf, r1 (root), r2 (toe)
constexpr double UNP_FLANGE_SLOPE = 8.0;

CatalogEntry<UNPDimensions> unp_row(const char* name, double h, double b, double tw,
                                    double tf, double r1, double r2) {
    return {name, UNPDimensions{
        .top_flange_total_width = b,
        .top_flange_thickness = tf,
        .bottom_flange_total_width = b,
        .bottom_flange_thickness = tf,
        .total_height = h,
        .web_thickness = tw,
        .top_root_fillet_radius = r1,
        .top_toe_radius = r2,
        .top_outer_corner_radius = 0.0,
        .bottom_root_fillet_radius = r1,
        .bottom_toe_radius = r2,
        .bottom_outer_corner_radius = 0.0,
        .top_slope = UNP_FLANGE_SLOPE,
        .bottom_slope = UNP_FLANGE_SLOPE
    }};
}

CatalogEntry<StripDimensions> strip_row(const char* name, double width, double height) {
    return {name, StripDimensions{.width = width, .height = height}};
}

template <typename Dimensions>
const CatalogEntry<Dimensions>* find_entry(const CatalogTable<Dimensions>& table,
                                           const std::string& name) {
    auto it = table.find(name);
    if (it != table.end()) {
        return &it->second;
    }

    std::string wanted = normalize_key(name);
    for (const auto& [key, entry] : table) {
        if (entry.name == name || normalize_key(key) == wanted ||
            normalize_key(entry.name) == wanted) {
            return &entry;
        }
    }
    return nullptr;
}

template <typename ProfileT, typename Dimensions>
std::shared_ptr<const ProfileT> lookup(const CatalogTable<Dimensions>& table,
                                       const std::string& name) {
    const auto* entry = find_entry(table, name);
    if (!entry) {
        throw ProfileNotFoundError(name);
    }
    logging::get_logger()->debug("Catalog: '{}' resolved to '{}'", name, entry->name);
    return std::make_shared<ProfileT>(entry->dimensions, entry->name);
}

template <typename Dimensions>
std::optional<std::string> key_of(const CatalogTable<Dimensions>& table, const std::string& name) {
    const auto* entry = find_entry(table, name);
    if (!entry) {
        return std::nullopt;
    }
    for (const auto& [key, candidate] : table) {
        if (&candidate == entry) {
            return key;
        }
    }
    return std::nullopt;
}

template <typename Dimensions>
std::vector<std::string> table_keys(const CatalogTable<Dimensions>& table) {
    std::vector<std::string> out;
    out.reserve(table.size());
    for (const auto& [key, entry] : table) {
        out.push_back(key);
    }
    return out;
}

}  // namespace

std::string normalize_key(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }
        out.push_back(c == '.' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return out;
}

const CatalogTable<RHSDimensions>& rhs_table() {
    static const CatalogTable<RHSDimensions> table = {
        {"RHS50x30x2_6", rhs_row("RHS50x30x2.6", 50, 30, 2.6, 2.6, 2.6, 2.6, 3.9, 3.9, 3.9, 3.9, 2.6, 2.6, 2.6, 2.6)},
        {"RHS50x30x3_2", rhs_row("RHS50x30x3.2", 50, 30, 3.2, 3.2, 3.2, 3.2, 4.8, 4.8, 4.8, 4.8, 3.2, 3.2, 3.2, 3.2)},
        {"RHS50x30x4", rhs_row("RHS50x30x4", 50, 30, 4, 4, 4, 4, 6, 6, 6, 6, 4, 4, 4, 4)},
        {"RHS50x30x5", rhs_row("RHS50x30x5", 50, 30, 5, 5, 5, 5, 7.5, 7.5, 7.5, 7.5, 5, 5, 5, 5)},
        {"RHS60x40x2_6", rhs_row("RHS60x40x2.6", 60, 40, 2.6, 2.6, 2.6, 2.6, 3.9, 3.9, 3.9, 3.9, 2.6, 2.6, 2.6, 2.6)},
        {"RHS60x40x3_2", rhs_row("RHS60x40x3.2", 60, 40, 3.2, 3.2, 3.2, 3.2, 4.8, 4.8, 4.8, 4.8, 3.2, 3.2, 3.2, 3.2)},
        {"RHS60x40x4", rhs_row("RHS60x40x4", 60, 40, 4, 4, 4, 4, 6, 6, 6, 6, 4, 4, 4, 4)},
        {"RHS60x40x5", rhs_row("RHS60x40x5", 60, 40, 5, 5, 5, 5, 7.5, 7.5, 7.5, 7.5, 5, 5, 5, 5)},
        {"RHS60x40x6_3", rhs_row("RHS60x40x6.3", 60, 40, 6.3, 6.3, 6.3, 6.3, 9.4, 9.4, 9.4, 9.4, 6.3, 6.3, 6.3, 6.3)},
        {"RHS80x40x3_2", rhs_row("RHS80x40x3.2", 80, 40, 3.2, 3.2, 3.2, 3.2, 4.8, 4.8, 4.8, 4.8, 3.2, 3.2, 3.2, 3.2)},
        {"RHS80x40x4", rhs_row("RHS80x40x4", 80, 40, 4, 4, 4, 4, 6, 6, 6, 6, 4, 4, 4, 4)},
        {"RHS80x40x5", rhs_row("RHS80x40x5", 80, 40, 5, 5, 5, 5, 7.5, 7.5, 7.5, 7.5, 5, 5, 5, 5)},
        {"RHS80x40x6_3", rhs_row("RHS80x40x6.3", 80, 40, 6.3, 6.3, 6.3, 6.3, 9.4, 9.4, 9.4, 9.4, 6.3, 6.3, 6.3, 6.3)},
        {"RHS80x40x8", rhs_row("RHS80x40x8", 80, 40, 8, 8, 8, 8, 12, 12, 12, 12, 8, 8, 8, 8)},
        {"RHS90x50x3_2", rhs_row("RHS90x50x3.2", 90, 50, 3.2, 3.2, 3.2, 3.2, 4.8, 4.8, 4.8, 4.8, 3.2, 3.2, 3.2, 3.2)},
        {"RHS90x50x4", rhs_row("RHS90x50x4", 90, 50, 4, 4, 4, 4, 6, 6, 6, 6, 4, 4, 4, 4)},
        {"RHS90x50x5", rhs_row("RHS90x50x5", 90, 50, 5, 5, 5, 5, 7.5, 7.5, 7.5, 7.5, 5, 5, 5, 5)},
        {"RHS90x50x6_3", rhs_row("RHS90x50x6.3", 90, 50, 6.3, 6.3, 6.3, 6.3, 9.4, 9.4, 9.4, 9.4, 6.3, 6.3, 6.3, 6.3)},
        {"RHS90x50x8", rhs_row("RHS90x50x8", 90, 50, 8, 8, 8, 8, 12, 12, 12, 12, 8, 8, 8, 8)},
        {"RHS100x50x3_2", rhs_row("RHS100x50x3.2", 100, 50, 3.2, 3.2, 3.2, 3.2, 4.8, 4.8, 4.8, 4.8, 3.2, 3.2, 3.2, 3.2)},
        {"RHS100x50x4", rhs_row("RHS100x50x4", 100, 50, 4, 4, 4, 4, 6, 6, 6, 6, 4, 4, 4, 4)},
        {"RHS100x50x5", rhs_row("RHS100x50x5", 100, 50, 5, 5, 5, 5, 7.5, 7.5, 7.5, 7.5, 5, 5, 5, 5)},
        {"RHS100x50x6_3", rhs_row("RHS100x50x6.3", 100, 50, 6.3, 6.3, 6.3, 6.3, 9.4, 9.4, 9.4, 9.4, 6.3, 6.3, 6.3, 6.3)},
        {"RHS100x50x8", rhs_row("RHS100x50x8", 100, 50, 8, 8, 8, 8, 12, 12, 12, 12, 8, 8, 8, 8)},
        {"RHS100x60x3_2", rhs_row("RHS100x60x3.2", 100, 60, 3.2, 3.2, 3.2, 3.2, 4.8, 4.8, 4.8, 4.8, 3.2, 3.2, 3.2, 3.2)},
        {"RHS100x60x4", rhs_row("RHS100x60x4", 100, 60, 4, 4, 4, 4, 6, 6, 6, 6, 4, 4, 4, 4)},
        {"RHS100x60x5", rhs_row("RHS100x60x5", 100, 60, 5, 5, 5, 5, 7.5, 7.5, 7.5, 7.5, 5, 5, 5, 5)},
        {"RHS100x60x6_3", rhs_row("RHS100x60x6.3", 100, 60, 6.3, 6.3, 6.3, 6.3, 9.4, 9.4, 9.4, 9.4, 6.3, 6.3, 6.3, 6.3)},
        {"RHS100x60x8", rhs_row("RHS100x60x8", 100, 60, 8, 8, 8, 8, 12, 12, 12, 12, 8, 8, 8, 8)},
        {"RHS120x60x4", rhs_row("RHS120x60x4", 120, 60, 4, 4, 4, 4, 6, 6, 6, 6, 4, 4, 4, 4)},
        {"RHS120x60x5", rhs_row("RHS120x60x5", 120, 60, 5, 5, 5, 5, 7.5, 7.5, 7.5, 7.5, 5, 5, 5, 5)},
        {"RHS120x60x6_3", rhs_row("RHS120x60x6.3", 120, 60, 6.3, 6.3, 6.3, 6.3, 9.4, 9.4, 9.4, 9.4, 6.3, 6.3, 6.3, 6.3)},
        {"RHS120x60x8", rhs_row("RHS120x60x8", 120, 60, 8, 8, 8, 8, 12, 12, 12, 12, 8, 8, 8, 8)},
        {"RHS120x60x10", rhs_row("RHS120x60x10", 120, 60, 10, 10, 10, 10, 15, 15, 15, 15, 10, 10, 10, 10)},
        {"RHS120x80x4", rhs_row("RHS120x80x4", 120, 80, 4, 4, 4, 4, 6, 6, 6, 6, 4, 4, 4, 4)},
        {"RHS120x80x5", rhs_row("RHS120x80x5", 120, 80, 5, 5, 5, 5, 7.5, 7.5, 7.5, 7.5, 5, 5, 5, 5)},
        {"RHS120x80x6_3", rhs_row("RHS120x80x6.3", 120, 80, 6.3, 6.3, 6.3, 6.3, 9.4, 9.4, 9.4, 9.4, 6.3, 6.3, 6.3, 6.3)},
        {"RHS120x80x8", rhs_row("RHS120x80x8", 120, 80, 8, 8, 8, 8, 12, 12, 12, 12, 8, 8, 8, 8)},
        {"RHS120x80x10", rhs_row("RHS120x80x10", 120, 80, 10, 10, 10, 10, 15, 15, 15, 15, 10, 10, 10, 10)},
        {"RHS140x80x4", rhs_row("RHS140x80x4", 140, 80, 4, 4, 4, 4, 6, 6, 6, 6, 4, 4, 4, 4)},
        {"RHS140x80x5", rhs_row("RHS140x80x5", 140, 80, 5, 5, 5, 5, 7.5, 7.5, 7.5, 7.5, 5, 5, 5, 5)},
        {"RHS140x80x6_3", rhs_row("RHS140x80x6.3", 140, 80, 6.3, 6.3, 6.3, 6.3, 9.4, 9.4, 9.4, 9.4, 6.3, 6.3, 6.3, 6.3)},
        {"RHS140x80x8", rhs_row("RHS140x80x8", 140, 80, 8, 8, 8, 8, 12, 12, 12, 12, 8, 8, 8, 8)},
        {"RHS140x80x10", rhs_row("RHS140x80x10", 140, 80, 10, 10, 10, 10, 15, 15, 15, 15, 10, 10, 10, 10)},
        {"RHS150x100x4", rhs_row("RHS150x100x4", 150, 100, 4, 4, 4, 4, 6, 6, 6, 6, 4, 4, 4, 4)},
        {"RHS150x100x5", rhs_row("RHS150x100x5", 150, 100, 5, 5, 5, 5, 7.5, 7.5, 7.5, 7.5, 5, 5, 5, 5)},
        {"RHS150x100x6_3", rhs_row("RHS150x100x6.3", 150, 100, 6.3, 6.3, 6.3, 6.3, 9.4, 9.4, 9.4, 9.4, 6.3, 6.3, 6.3, 6.3)},
        {"RHS150x100x8", rhs_row("RHS150x100x8", 150, 100, 8, 8, 8, 8, 12, 12, 12, 12, 8, 8, 8, 8)},
        {"RHS150x100x10", rhs_row("RHS150x100x10", 150, 100, 10, 10, 10, 10, 15, 15, 15, 15, 10, 10, 10, 10)},
        {"RHS150x100x12_5", rhs_row("RHS150x100x12.5", 150, 100, 12.5, 12.5, 12.5, 12.5, 18.8, 18.8, 18.8, 18.8, 12.5, 12.5, 12.5, 12.5)},
        {"RHS160x80x4", rhs_row("RHS160x80x4", 160, 80, 4, 4, 4, 4, 6, 6, 6, 6, 4, 4, 4, 4)},
        {"RHS160x80x5", rhs_row("RHS160x80x5", 160, 80, 5, 5, 5, 5, 7.5, 7.5, 7.5, 7.5, 5, 5, 5, 5)},
        {"RHS160x80x6_3", rhs_row("RHS160x80x6.3", 160, 80, 6.3, 6.3, 6.3, 6.3, 9.4, 9.4, 9.4, 9.4, 6.3, 6.3, 6.3, 6.3)},
        {"RHS160x80x8", rhs_row("RHS160x80x8", 160, 80, 8, 8, 8, 8, 12, 12, 12, 12, 8, 8, 8, 8)},
        {"RHS160x80x10", rhs_row("RHS160x80x10", 160, 80, 10, 10, 10, 10, 15, 15, 15, 15, 10, 10, 10, 10)},
        {"RHS160x80x12_5", rhs_row("RHS160x80x12.5", 160, 80, 12.5, 12.5, 12.5, 12.5, 18.8, 18.8, 18.8, 18.8, 12.5, 12.5, 12.5, 12.5)},
        {"RHS180x100x4", rhs_row("RHS180x100x4", 180, 100, 4, 4, 4, 4, 6, 6, 6, 6, 4, 4, 4, 4)},
        {"RHS180x100x5", rhs_row("RHS180x100x5", 180, 100, 5, 5, 5, 5, 7.5, 7.5, 7.5, 7.5, 5, 5, 5, 5)},
        {"RHS180x100x6_3", rhs_row("RHS180x100x6.3", 180, 100, 6.3, 6.3, 6.3, 6.3, 9.4, 9.4, 9.4, 9.4, 6.3, 6.3, 6.3, 6.3)},
        {"RHS180x100x8", rhs_row("RHS180x100x8", 180, 100, 8, 8, 8, 8, 12, 12, 12, 12, 8, 8, 8, 8)},
        {"RHS180x100x10", rhs_row("RHS180x100x10", 180, 100, 10, 10, 10, 10, 15, 15, 15, 15, 10, 10, 10, 10)},
        {"RHS180x100x12_5", rhs_row("RHS180x100x12.5", 180, 100, 12.5, 12.5, 12.5, 12.5, 18.8, 18.8, 18.8, 18.8, 12.5, 12.5, 12.5, 12.5)},
        {"RHS200x100x4", rhs_row("RHS200x100x4", 200, 100, 4, 4, 4, 4, 6, 6, 6, 6, 4, 4, 4, 4)},
        {"RHS200x100x5", rhs_row("RHS200x100x5", 200, 100, 5, 5, 5, 5, 7.5, 7.5, 7.5, 7.5, 5, 5, 5, 5)},
        {"RHS200x100x6_3", rhs_row("RHS200x100x6.3", 200, 100, 6.3, 6.3, 6.3, 6.3, 9.4, 9.4, 9.4, 9.4, 6.3, 6.3, 6.3, 6.3)},
        {"RHS200x100x8", rhs_row("RHS200x100x8", 200, 100, 8, 8, 8, 8, 12, 12, 12, 12, 8, 8, 8, 8)},
        {"RHS200x100x10", rhs_row("RHS200x100x10", 200, 100, 10, 10, 10, 10, 15, 15, 15, 15, 10, 10, 10, 10)},
        {"RHS200x100x12_5", rhs_row("RHS200x100x12.5", 200, 100, 12.5, 12.5, 12.5, 12.5, 18.8, 18.8, 18.8, 18.8, 12.5, 12.5, 12.5, 12.5)},
        {"RHS200x100x16", rhs_row("RHS200x100x16", 200, 100, 16, 16, 16, 16, 24, 24, 24, 24, 16, 16, 16, 16)},
        {"RHS200x120x6_3", rhs_row("RHS200x120x6.3", 200, 120, 6.3, 6.3, 6.3, 6.3, 9.4, 9.4, 9.4, 9.4, 6.3, 6.3, 6.3, 6.3)},
        {"RHS200x120x8", rhs_row("RHS200x120x8", 200, 120, 8, 8, 8, 8, 12, 12, 12, 12, 8, 8, 8, 8)},
        {"RHS200x120x10", rhs_row("RHS200x120x10", 200, 120, 10, 10, 10, 10, 15, 15, 15, 15, 10, 10, 10, 10)},
        {"RHS200x120x12_5", rhs_row("RHS200x120x12.5", 200, 120, 12.5, 12.5, 12.5, 12.5, 18.8, 18.8, 18.8, 18.8, 12.5, 12.5, 12.5, 12.5)},
        {"RHS250x150x6_3", rhs_row("RHS250x150x6.3", 250, 150, 6.3, 6.3, 6.3, 6.3, 9.4, 9.4, 9.4, 9.4, 6.3, 6.3, 6.3, 6.3)},
        {"RHS250x150x8", rhs_row("RHS250x150x8", 250, 150, 8, 8, 8, 8, 12, 12, 12, 12, 8, 8, 8, 8)},
        {"RHS250x150x10", rhs_row("RHS250x150x10", 250, 150, 10, 10, 10, 10, 15, 15, 15, 15, 10, 10, 10, 10)},
        {"RHS250x150x12_5", rhs_row("RHS250x150x12.5", 250, 150, 12.5, 12.5, 12.5, 12.5, 18.8, 18.8, 18.8, 18.8, 12.5, 12.5, 12.5, 12.5)},
        {"RHS250x150x14_2", rhs_row("RHS250x150x14.2", 250, 150, 14.2, 14.2, 14.2, 14.2, 21.3, 21.3, 21.3, 21.3, 14.2, 14.2, 14.2, 14.2)},
        {"RHS250x150x16", rhs_row("RHS250x150x16", 250, 150, 16, 16, 16, 16, 24, 24, 24, 24, 16, 16, 16, 16)},
        {"RHS260x180x6_3", rhs_row("RHS260x180x6.3", 260, 180, 6.3, 6.3, 6.3, 6.3, 9.4, 9.4, 9.4, 9.4, 6.3, 6.3, 6.3, 6.3)},
        {"RHS260x180x8", rhs_row("RHS260x180x8", 260, 180, 8, 8, 8, 8, 12, 12, 12, 12, 8, 8, 8, 8)},
        {"RHS260x180x10", rhs_row("RHS260x180x10", 260, 180, 10, 10, 10, 10, 15, 15, 15, 15, 10, 10, 10, 10)},
        {"RHS260x180x12_5", rhs_row("RHS260x180x12.5", 260, 180, 12.5, 12.5, 12.5, 12.5, 18.8, 18.8, 18.8, 18.8, 12.5, 12.5, 12.5, 12.5)},
        {"RHS260x180x14_2", rhs_row("RHS260x180x14.2", 260, 180, 14.2, 14.2, 14.2, 14.2, 21.3, 21.3, 21.3, 21.3, 14.2, 14.2, 14.2, 14.2)},
        {"RHS260x180x16", rhs_row("RHS260x180x16", 260, 180, 16, 16, 16, 16, 24, 24, 24, 24, 16, 16, 16, 16)},
        {"RHS300x200x6_3", rhs_row("RHS300x200x6.3", 300, 200, 6.3, 6.3, 6.3, 6.3, 9.4, 9.4, 9.4, 9.4, 6.3, 6.3, 6.3, 6.3)},
        {"RHS300x200x8", rhs_row("RHS300x200x8", 300, 200, 8, 8, 8, 8, 12, 12, 12, 12, 8, 8, 8, 8)},
        {"RHS300x200x10", rhs_row("RHS300x200x10", 300, 200, 10, 10, 10, 10, 15, 15, 15, 15, 10, 10, 10, 10)},
        {"RHS300x200x12_5", rhs_row("RHS300x200x12.5", 300, 200, 12.5, 12.5, 12.5, 12.5, 18.8, 18.8, 18.8, 18.8, 12.5, 12.5, 12.5, 12.5)},
        {"RHS300x200x14_2", rhs_row("RHS300x200x14.2", 300, 200, 14.2, 14.2, 14.2, 14.2, 21.3, 21.3, 21.3, 21.3, 14.2, 14.2, 14.2, 14.2)},
        {"RHS300x200x16", rhs_row("RHS300x200x16", 300, 200, 16, 16, 16, 16, 24, 24, 24, 24, 16, 16, 16, 16)},
        {"RHS350x250x6_3", rhs_row("RHS350x250x6.3", 350, 250, 6.3, 6.3, 6.3, 6.3, 9.4, 9.4, 9.4, 9.4, 6.3, 6.3, 6.3, 6.3)},
        {"RHS350x250x8", rhs_row("RHS350x250x8", 350, 250, 8, 8, 8, 8, 12, 12, 12, 12, 8, 8, 8, 8)},
        {"RHS350x250x10", rhs_row("RHS350x250x10", 350, 250, 10, 10, 10, 10, 15, 15, 15, 15, 10, 10, 10, 10)},
        {"RHS350x250x12_5", rhs_row("RHS350x250x12.5", 350, 250, 12.5, 12.5, 12.5, 12.5, 18.8, 18.8, 18.8, 18.8, 12.5, 12.5, 12.5, 12.5)},
        {"RHS350x250x14_2", rhs_row("RHS350x250x14.2", 350, 250, 14.2, 14.2, 14.2, 14.2, 21.3, 21.3, 21.3, 21.3, 14.2, 14.2, 14.2, 14.2)},
        {"RHS350x250x16", rhs_row("RHS350x250x16", 350, 250, 16, 16, 16, 16, 24, 24, 24, 24, 16, 16, 16, 16)},
        {"RHS400x200x8", rhs_row("RHS400x200x8", 400, 200, 8, 8, 8, 8, 12, 12, 12, 12, 8, 8, 8, 8)},
        {"RHS400x200x10", rhs_row("RHS400x200x10", 400, 200, 10, 10, 10, 10, 15, 15, 15, 15, 10, 10, 10, 10)},
        {"RHS400x200x12_5", rhs_row("RHS400x200x12.5", 400, 200, 12.5, 12.5, 12.5, 12.5, 18.8, 18.8, 18.8, 18.8, 12.5, 12.5, 12.5, 12.5)},
        {"RHS400x200x14_2", rhs_row("RHS400x200x14.2", 400, 200, 14.2, 14.2, 14.2, 14.2, 21.3, 21.3, 21.3, 21.3, 14.2, 14.2, 14.2, 14.2)},
        {"RHS400x200x16", rhs_row("RHS400x200x16", 400, 200, 16, 16, 16, 16, 24, 24, 24, 24, 16, 16, 16, 16)},
        {"RHS450x250x8", rhs_row("RHS450x250x8", 450, 250, 8, 8, 8, 8, 12, 12, 12, 12, 8, 8, 8, 8)},
        {"RHS450x250x10", rhs_row("RHS450x250x10", 450, 250, 10, 10, 10, 10, 15, 15, 15, 15, 10, 10, 10, 10)},
        {"RHS450x250x12_5", rhs_row("RHS450x250x12.5", 450, 250, 12.5, 12.5, 12.5, 12.5, 18.8, 18.8, 18.8, 18.8, 12.5, 12.5, 12.5, 12.5)},
        {"RHS450x250x14_2", rhs_row("RHS450x250x14.2", 450, 250, 14.2, 14.2, 14.2, 14.2, 21.3, 21.3, 21.3, 21.3, 14.2, 14.2, 14.2, 14.2)},
        {"RHS450x250x16", rhs_row("RHS450x250x16", 450, 250, 16, 16, 16, 16, 24, 24, 24, 24, 16, 16, 16, 16)},
        {"RHS500x300x10", rhs_row("RHS500x300x10", 500, 300, 10, 10, 10, 10, 15, 15, 15, 15, 10, 10, 10, 10)},
        {"RHS500x300x12_5", rhs_row("RHS500x300x12.5", 500, 300, 12.5, 12.5, 12.5, 12.5, 18.8, 18.8, 18.8, 18.8, 12.5, 12.5, 12.5, 12.5)},
        {"RHS500x300x14_2", rhs_row("RHS500x300x14.2", 500, 300, 14.2, 14.2, 14.2, 14.2, 21.3, 21.3, 21.3, 21.3, 14.2, 14.2, 14.2, 14.2)},
        {"RHS500x300x16", rhs_row("RHS500x300x16", 500, 300, 16, 16, 16, 16, 24, 24, 24, 24, 16, 16, 16, 16)},
        {"RHS500x300x20", rhs_row("RHS500x300x20", 500, 300, 20, 20, 20, 20, 30, 30, 30, 30, 20, 20, 20, 20)},
    };
    return table;
}

const CatalogTable<RHSDimensions>& shs_table() {
    static const CatalogTable<RHSDimensions> table = {
        {"SHS40x2_6", rhs_row("SHS40x2.6", 40, 40, 2.6, 2.6, 2.6, 2.6, 3.9, 3.9, 3.9, 3.9, 2.6, 2.6, 2.6, 2.6)},
        {"SHS40x3_2", rhs_row("SHS40x3.2", 40, 40, 3.2, 3.2, 3.2, 3.2, 4.8, 4.8, 4.8, 4.8, 3.2, 3.2, 3.2, 3.2)},
        {"SHS40x4", rhs_row("SHS40x4", 40, 40, 4, 4, 4, 4, 6, 6, 6, 6, 4, 4, 4, 4)},
        {"SHS40x5", rhs_row("SHS40x5", 40, 40, 5, 5, 5, 5, 7.5, 7.5, 7.5, 7.5, 5, 5, 5, 5)},
        {"SHS50x2_6", rhs_row("SHS50x2.6", 50, 50, 2.6, 2.6, 2.6, 2.6, 3.9, 3.9, 3.9, 3.9, 2.6, 2.6, 2.6, 2.6)},
        {"SHS50x3_2", rhs_row("SHS50x3.2", 50, 50, 3.2, 3.2, 3.2, 3.2, 4.8, 4.8, 4.8, 4.8, 3.2, 3.2, 3.2, 3.2)},
        {"SHS50x4", rhs_row("SHS50x4", 50, 50, 4, 4, 4, 4, 6, 6, 6, 6, 4, 4, 4, 4)},
        {"SHS50x5", rhs_row("SHS50x5", 50, 50, 5, 5, 5, 5, 7.5, 7.5, 7.5, 7.5, 5, 5, 5, 5)},
        {"SHS50x6_3", rhs_row("SHS50x6.3", 50, 50, 6.3, 6.3, 6.3, 6.3, 9.4, 9.4, 9.4, 9.4, 6.3, 6.3, 6.3, 6.3)},
        {"SHS60x2_6", rhs_row("SHS60x2.6", 60, 60, 2.6, 2.6, 2.6, 2.6, 3.9, 3.9, 3.9, 3.9, 2.6, 2.6, 2.6, 2.6)},
        {"SHS60x3_2", rhs_row("SHS60x3.2", 60, 60, 3.2, 3.2, 3.2, 3.2, 4.8, 4.8, 4.8, 4.8, 3.2, 3.2, 3.2, 3.2)},
        {"SHS60x4", rhs_row("SHS60x4", 60, 60, 4, 4, 4, 4, 6, 6, 6, 6, 4, 4, 4, 4)},
        {"SHS60x5", rhs_row("SHS60x5", 60, 60, 5, 5, 5, 5, 7.5, 7.5, 7.5, 7.5, 5, 5, 5, 5)},
        {"SHS60x6_3", rhs_row("SHS60x6.3", 60, 60, 6.3, 6.3, 6.3, 6.3, 9.4, 9.4, 9.4, 9.4, 6.3, 6.3, 6.3, 6.3)},
        {"SHS60x8", rhs_row("SHS60x8", 60, 60, 8, 8, 8, 8, 12, 12, 12, 12, 8, 8, 8, 8)},
        {"SHS70x3_2", rhs_row("SHS70x3.2", 70, 70, 3.2, 3.2, 3.2, 3.2, 4.8, 4.8, 4.8, 4.8, 3.2, 3.2, 3.2, 3.2)},
        {"SHS70x4", rhs_row("SHS70x4", 70, 70, 4, 4, 4, 4, 6, 6, 6, 6, 4, 4, 4, 4)},
        {"SHS70x5", rhs_row("SHS70x5", 70, 70, 5, 5, 5, 5, 7.5, 7.5, 7.5, 7.5, 5, 5, 5, 5)},
        {"SHS70x6_3", rhs_row("SHS70x6.3", 70, 70, 6.3, 6.3, 6.3, 6.3, 9.4, 9.4, 9.4, 9.4, 6.3, 6.3, 6.3, 6.3)},
        {"SHS70x8", rhs_row("SHS70x8", 70, 70, 8, 8, 8, 8, 12, 12, 12, 12, 8, 8, 8, 8)},
        {"SHS80x3_2", rhs_row("SHS80x3.2", 80, 80, 3.2, 3.2, 3.2, 3.2, 4.8, 4.8, 4.8, 4.8, 3.2, 3.2, 3.2, 3.2)},
        {"SHS80x4", rhs_row("SHS80x4", 80, 80, 4, 4, 4, 4, 6, 6, 6, 6, 4, 4, 4, 4)},
        {"SHS80x5", rhs_row("SHS80x5", 80, 80, 5, 5, 5, 5, 7.5, 7.5, 7.5, 7.5, 5, 5, 5, 5)},
        {"SHS80x6_3", rhs_row("SHS80x6.3", 80, 80, 6.3, 6.3, 6.3, 6.3, 9.4, 9.4, 9.4, 9.4, 6.3, 6.3, 6.3, 6.3)},
        {"SHS80x8", rhs_row("SHS80x8", 80, 80, 8, 8, 8, 8, 12, 12, 12, 12, 8, 8, 8, 8)},
        {"SHS90x4", rhs_row("SHS90x4", 90, 90, 4, 4, 4, 4, 6, 6, 6, 6, 4, 4, 4, 4)},
        {"SHS90x5", rhs_row("SHS90x5", 90, 90, 5, 5, 5, 5, 7.5, 7.5, 7.5, 7.5, 5, 5, 5, 5)},
        {"SHS90x6_3", rhs_row("SHS90x6.3", 90, 90, 6.3, 6.3, 6.3, 6.3, 9.4, 9.4, 9.4, 9.4, 6.3, 6.3, 6.3, 6.3)},
        {"SHS90x8", rhs_row("SHS90x8", 90, 90, 8, 8, 8, 8, 12, 12, 12, 12, 8, 8, 8, 8)},
        {"SHS100x4", rhs_row("SHS100x4", 100, 100, 4, 4, 4, 4, 6, 6, 6, 6, 4, 4, 4, 4)},
        {"SHS100x5", rhs_row("SHS100x5", 100, 100, 5, 5, 5, 5, 7.5, 7.5, 7.5, 7.5, 5, 5, 5, 5)},
        {"SHS100x6_3", rhs_row("SHS100x6.3", 100, 100, 6.3, 6.3, 6.3, 6.3, 9.4, 9.4, 9.4, 9.4, 6.3, 6.3, 6.3, 6.3)},
        {"SHS100x8", rhs_row("SHS100x8", 100, 100, 8, 8, 8, 8, 12, 12, 12, 12, 8, 8, 8, 8)},
        {"SHS100x10", rhs_row("SHS100x10", 100, 100, 10, 10, 10, 10, 15, 15, 15, 15, 10, 10, 10, 10)},
        {"SHS120x5", rhs_row("SHS120x5", 120, 120, 5, 5, 5, 5, 7.5, 7.5, 7.5, 7.5, 5, 5, 5, 5)},
        {"SHS120x6_3", rhs_row("SHS120x6.3", 120, 120, 6.3, 6.3, 6.3, 6.3, 9.4, 9.4, 9.4, 9.4, 6.3, 6.3, 6.3, 6.3)},
        {"SHS120x8", rhs_row("SHS120x8", 120, 120, 8, 8, 8, 8, 12, 12, 12, 12, 8, 8, 8, 8)},
        {"SHS120x10", rhs_row("SHS120x10", 120, 120, 10, 10, 10, 10, 15, 15, 15, 15, 10, 10, 10, 10)},
        {"SHS120x12_5", rhs_row("SHS120x12.5", 120, 120, 12.5, 12.5, 12.5, 12.5, 18.8, 18.8, 18.8, 18.8, 12.5, 12.5, 12.5, 12.5)},
        {"SHS140x5", rhs_row("SHS140x5", 140, 140, 5, 5, 5, 5, 7.5, 7.5, 7.5, 7.5, 5, 5, 5, 5)},
        {"SHS140x6_3", rhs_row("SHS140x6.3", 140, 140, 6.3, 6.3, 6.3, 6.3, 9.4, 9.4, 9.4, 9.4, 6.3, 6.3, 6.3, 6.3)},
        {"SHS140x8", rhs_row("SHS140x8", 140, 140, 8, 8, 8, 8, 12, 12, 12, 12, 8, 8, 8, 8)},
        {"SHS140x10", rhs_row("SHS140x10", 140, 140, 10, 10, 10, 10, 15, 15, 15, 15, 10, 10, 10, 10)},
        {"SHS140x12_5", rhs_row("SHS140x12.5", 140, 140, 12.5, 12.5, 12.5, 12.5, 18.8, 18.8, 18.8, 18.8, 12.5, 12.5, 12.5, 12.5)},
        {"SHS150x5", rhs_row("SHS150x5", 150, 150, 5, 5, 5, 5, 7.5, 7.5, 7.5, 7.5, 5, 5, 5, 5)},
        {"SHS150x6_3", rhs_row("SHS150x6.3", 150, 150, 6.3, 6.3, 6.3, 6.3, 9.4, 9.4, 9.4, 9.4, 6.3, 6.3, 6.3, 6.3)},
        {"SHS150x8", rhs_row("SHS150x8", 150, 150, 8, 8, 8, 8, 12, 12, 12, 12, 8, 8, 8, 8)},
        {"SHS150x10", rhs_row("SHS150x10", 150, 150, 10, 10, 10, 10, 15, 15, 15, 15, 10, 10, 10, 10)},
        {"SHS150x12_5", rhs_row("SHS150x12.5", 150, 150, 12.5, 12.5, 12.5, 12.5, 18.8, 18.8, 18.8, 18.8, 12.5, 12.5, 12.5, 12.5)},
        {"SHS150x14_2", rhs_row("SHS150x14.2", 150, 150, 14.2, 14.2, 14.2, 14.2, 21.3, 21.3, 21.3, 21.3, 14.2, 14.2, 14.2, 14.2)},
        {"SHS150x16", rhs_row("SHS150x16", 150, 150, 16, 16, 16, 16, 24, 24, 24, 24, 16, 16, 16, 16)},
        {"SHS160x5", rhs_row("SHS160x5", 160, 160, 5, 5, 5, 5, 7.5, 7.5, 7.5, 7.5, 5, 5, 5, 5)},
        {"SHS160x6_3", rhs_row("SHS160x6.3", 160, 160, 6.3, 6.3, 6.3, 6.3, 9.4, 9.4, 9.4, 9.4, 6.3, 6.3, 6.3, 6.3)},
        {"SHS160x8", rhs_row("SHS160x8", 160, 160, 8, 8, 8, 8, 12, 12, 12, 12, 8, 8, 8, 8)},
        {"SHS160x10", rhs_row("SHS160x10", 160, 160, 10, 10, 10, 10, 15, 15, 15, 15, 10, 10, 10, 10)},
        {"SHS160x12_5", rhs_row("SHS160x12.5", 160, 160, 12.5, 12.5, 12.5, 12.5, 18.8, 18.8, 18.8, 18.8, 12.5, 12.5, 12.5, 12.5)},
        {"SHS160x14_2", rhs_row("SHS160x14.2", 160, 160, 14.2, 14.2, 14.2, 14.2, 21.3, 21.3, 21.3, 21.3, 14.2, 14.2, 14.2, 14.2)},
        {"SHS160x16", rhs_row("SHS160x16", 160, 160, 16, 16, 16, 16, 24, 24, 24, 24, 16, 16, 16, 16)},
        {"SHS180x5", rhs_row("SHS180x5", 180, 180, 5, 5, 5, 5, 7.5, 7.5, 7.5, 7.5, 5, 5, 5, 5)},
        {"SHS180x6_3", rhs_row("SHS180x6.3", 180, 180, 6.3, 6.3, 6.3, 6.3, 9.4, 9.4, 9.4, 9.4, 6.3, 6.3, 6.3, 6.3)},
        {"SHS180x8", rhs_row("SHS180x8", 180, 180, 8, 8, 8, 8, 12, 12, 12, 12, 8, 8, 8, 8)},
        {"SHS180x10", rhs_row("SHS180x10", 180, 180, 10, 10, 10, 10, 15, 15, 15, 15, 10, 10, 10, 10)},
        {"SHS180x12_5", rhs_row("SHS180x12.5", 180, 180, 12.5, 12.5, 12.5, 12.5, 18.8, 18.8, 18.8, 18.8, 12.5, 12.5, 12.5, 12.5)},
        {"SHS180x14_2", rhs_row("SHS180x14.2", 180, 180, 14.2, 14.2, 14.2, 14.2, 21.3, 21.3, 21.3, 21.3, 14.2, 14.2, 14.2, 14.2)},
        {"SHS180x16", rhs_row("SHS180x16", 180, 180, 16, 16, 16, 16, 24, 24, 24, 24, 16, 16, 16, 16)},
        {"SHS200x5", rhs_row("SHS200x5", 200, 200, 5, 5, 5, 5, 7.5, 7.5, 7.5, 7.5, 5, 5, 5, 5)},
        {"SHS200x6_3", rhs_row("SHS200x6.3", 200, 200, 6.3, 6.3, 6.3, 6.3, 9.4, 9.4, 9.4, 9.4, 6.3, 6.3, 6.3, 6.3)},
        {"SHS200x8", rhs_row("SHS200x8", 200, 200, 8, 8, 8, 8, 12, 12, 12, 12, 8, 8, 8, 8)},
        {"SHS200x10", rhs_row("SHS200x10", 200, 200, 10, 10, 10, 10, 15, 15, 15, 15, 10, 10, 10, 10)},
        {"SHS200x12_5", rhs_row("SHS200x12.5", 200, 200, 12.5, 12.5, 12.5, 12.5, 18.8, 18.8, 18.8, 18.8, 12.5, 12.5, 12.5, 12.5)},
        {"SHS200x14_2", rhs_row("SHS200x14.2", 200, 200, 14.2, 14.2, 14.2, 14.2, 21.3, 21.3, 21.3, 21.3, 14.2, 14.2, 14.2, 14.2)},
        {"SHS200x16", rhs_row("SHS200x16", 200, 200, 16, 16, 16, 16, 24, 24, 24, 24, 16, 16, 16, 16)},
        {"SHS220x6_3", rhs_row("SHS220x6.3", 220, 220, 6.3, 6.3, 6.3, 6.3, 9.4, 9.4, 9.4, 9.4, 6.3, 6.3, 6.3, 6.3)},
        {"SHS220x8", rhs_row("SHS220x8", 220, 220, 8, 8, 8, 8, 12, 12, 12, 12, 8, 8, 8, 8)},
        {"SHS220x10", rhs_row("SHS220x10", 220, 220, 10, 10, 10, 10, 15, 15, 15, 15, 10, 10, 10, 10)},
        {"SHS220x12_5", rhs_row("SHS220x12.5", 220, 220, 12.5, 12.5, 12.5, 12.5, 18.8, 18.8, 18.8, 18.8, 12.5, 12.5, 12.5, 12.5)},
        {"SHS220x14_2", rhs_row("SHS220x14.2", 220, 220, 14.2, 14.2, 14.2, 14.2, 21.3, 21.3, 21.3, 21.3, 14.2, 14.2, 14.2, 14.2)},
        {"SHS220x16", rhs_row("SHS220x16", 220, 220, 16, 16, 16, 16, 24, 24, 24, 24, 16, 16, 16, 16)},
        {"SHS250x6_3", rhs_row("SHS250x6.3", 250, 250, 6.3, 6.3, 6.3, 6.3, 9.4, 9.4, 9.4, 9.4, 6.3, 6.3, 6.3, 6.3)},
        {"SHS250x8", rhs_row("SHS250x8", 250, 250, 8, 8, 8, 8, 12, 12, 12, 12, 8, 8, 8, 8)},
        {"SHS250x10", rhs_row("SHS250x10", 250, 250, 10, 10, 10, 10, 15, 15, 15, 15, 10, 10, 10, 10)},
        {"SHS250x12_5", rhs_row("SHS250x12.5", 250, 250, 12.5, 12.5, 12.5, 12.5, 18.8, 18.8, 18.8, 18.8, 12.5, 12.5, 12.5, 12.5)},
        {"SHS250x14_2", rhs_row("SHS250x14.2", 250, 250, 14.2, 14.2, 14.2, 14.2, 21.3, 21.3, 21.3, 21.3, 14.2, 14.2, 14.2, 14.2)},
        {"SHS250x16", rhs_row("SHS250x16", 250, 250, 16, 16, 16, 16, 24, 24, 24, 24, 16, 16, 16, 16)},
        {"SHS260x6_3", rhs_row("SHS260x6.3", 260, 260, 6.3, 6.3, 6.3, 6.3, 9.4, 9.4, 9.4, 9.4, 6.3, 6.3, 6.3, 6.3)},
        {"SHS260x8", rhs_row("SHS260x8", 260, 260, 8, 8, 8, 8, 12, 12, 12, 12, 8, 8, 8, 8)},
        {"SHS260x10", rhs_row("SHS260x10", 260, 260, 10, 10, 10, 10, 15, 15, 15, 15, 10, 10, 10, 10)},
        {"SHS260x12_5", rhs_row("SHS260x12.5", 260, 260, 12.5, 12.5, 12.5, 12.5, 18.8, 18.8, 18.8, 18.8, 12.5, 12.5, 12.5, 12.5)},
        {"SHS260x14_2", rhs_row("SHS260x14.2", 260, 260, 14.2, 14.2, 14.2, 14.2, 21.3, 21.3, 21.3, 21.3, 14.2, 14.2, 14.2, 14.2)},
        {"SHS260x16", rhs_row("SHS260x16", 260, 260, 16, 16, 16, 16, 24, 24, 24, 24, 16, 16, 16, 16)},
        {"SHS300x6_3", rhs_row("SHS300x6.3", 300, 300, 6.3, 6.3, 6.3, 6.3, 9.4, 9.4, 9.4, 9.4, 6.3, 6.3, 6.3, 6.3)},
        {"SHS300x8", rhs_row("SHS300x8", 300, 300, 8, 8, 8, 8, 12, 12, 12, 12, 8, 8, 8, 8)},
        {"SHS300x10", rhs_row("SHS300x10", 300, 300, 10, 10, 10, 10, 15, 15, 15, 15, 10, 10, 10, 10)},
        {"SHS300x12_5", rhs_row("SHS300x12.5", 300, 300, 12.5, 12.5, 12.5, 12.5, 18.8, 18.8, 18.8, 18.8, 12.5, 12.5, 12.5, 12.5)},
        {"SHS300x14_2", rhs_row("SHS300x14.2", 300, 300, 14.2, 14.2, 14.2, 14.2, 21.3, 21.3, 21.3, 21.3, 14.2, 14.2, 14.2, 14.2)},
        {"SHS300x16", rhs_row("SHS300x16", 300, 300, 16, 16, 16, 16, 24, 24, 24, 24, 16, 16, 16, 16)},
        {"SHS350x8", rhs_row("SHS350x8", 350, 350, 8, 8, 8, 8, 12, 12, 12, 12, 8, 8, 8, 8)},
        {"SHS350x10", rhs_row("SHS350x10", 350, 350, 10, 10, 10, 10, 15, 15, 15, 15, 10, 10, 10, 10)},
        {"SHS350x12_5", rhs_row("SHS350x12.5", 350, 350, 12.5, 12.5, 12.5, 12.5, 18.8, 18.8, 18.8, 18.8, 12.5, 12.5, 12.5, 12.5)},
        {"SHS350x14_2", rhs_row("SHS350x14.2", 350, 350, 14.2, 14.2, 14.2, 14.2, 21.3, 21.3, 21.3, 21.3, 14.2, 14.2, 14.2, 14.2)},
        {"SHS350x16", rhs_row("SHS350x16", 350, 350, 16, 16, 16, 16, 24, 24, 24, 24, 16, 16, 16, 16)},
        {"SHS400x10", rhs_row("SHS400x10", 400, 400, 10, 10, 10, 10, 15, 15, 15, 15, 10, 10, 10, 10)},
        {"SHS400x12_5", rhs_row("SHS400x12.5", 400, 400, 12.5, 12.5, 12.5, 12.5, 18.8, 18.8, 18.8, 18.8, 12.5, 12.5, 12.5, 12.5)},
        {"SHS400x14_2", rhs_row("SHS400x14.2", 400, 400, 14.2, 14.2, 14.2, 14.2, 21.3, 21.3, 21.3, 21.3, 14.2, 14.2, 14.2, 14.2)},
        {"SHS400x16", rhs_row("SHS400x16", 400, 400, 16, 16, 16, 16, 24, 24, 24, 24, 16, 16, 16, 16)},
        {"SHS400x20", rhs_row("SHS400x20", 400, 400, 20, 20, 20, 20, 30, 30, 30, 30, 20, 20, 20, 20)},
    };
    return table;
}

const CatalogTable<CHSDimensions>& chs_table() {
    static const CatalogTable<CHSDimensions> table = {
        {"CHS21_3x2_3", chs_row("CHS 21.3x2.3", 21.3, 2.3)},
        {"CHS21_3x2_6", chs_row("CHS 21.3x2.6", 21.3, 2.6)},
        {"CHS21_3x3_2", chs_row("CHS 21.3x3.2", 21.3, 3.2)},
        {"CHS26_9x2_3", chs_row("CHS 26.9x2.3", 26.9, 2.3)},
        {"CHS26_9x2_6", chs_row("CHS 26.9x2.6", 26.9, 2.6)},
        {"CHS26_9x3_2", chs_row("CHS 26.9x3.2", 26.9, 3.2)},
        {"CHS33_7x2_6", chs_row("CHS 33.7x2.6", 33.7, 2.6)},
        {"CHS33_7x3_2", chs_row("CHS 33.7x3.2", 33.7, 3.2)},
        {"CHS33_7x4", chs_row("CHS 33.7x4", 33.7, 4)},
        {"CHS42_4x2_6", chs_row("CHS 42.4x2.6", 42.4, 2.6)},
        {"CHS42_4x3_2", chs_row("CHS 42.4x3.2", 42.4, 3.2)},
        {"CHS42_4x4", chs_row("CHS 42.4x4", 42.4, 4)},
        {"CHS48_3x2_6", chs_row("CHS 48.3x2.6", 48.3, 2.6)},
        {"CHS48_3x3_2", chs_row("CHS 48.3x3.2", 48.3, 3.2)},
        {"CHS48_3x4", chs_row("CHS 48.3x4", 48.3, 4)},
        {"CHS48_3x5", chs_row("CHS 48.3x5", 48.3, 5)},
        {"CHS60_3x2_6", chs_row("CHS 60.3x2.6", 60.3, 2.6)},
        {"CHS60_3x3_2", chs_row("CHS 60.3x3.2", 60.3, 3.2)},
        {"CHS60_3x4", chs_row("CHS 60.3x4", 60.3, 4)},
        {"CHS60_3x5", chs_row("CHS 60.3x5", 60.3, 5)},
        {"CHS76_1x2_6", chs_row("CHS 76.1x2.6", 76.1, 2.6)},
        {"CHS76_1x3_2", chs_row("CHS 76.1x3.2", 76.1, 3.2)},
        {"CHS76_1x4", chs_row("CHS 76.1x4", 76.1, 4)},
        {"CHS76_1x5", chs_row("CHS 76.1x5", 76.1, 5)},
        {"CHS88_9x3_2", chs_row("CHS 88.9x3.2", 88.9, 3.2)},
        {"CHS88_9x4", chs_row("CHS 88.9x4", 88.9, 4)},
        {"CHS88_9x5", chs_row("CHS 88.9x5", 88.9, 5)},
        {"CHS88_9x6_3", chs_row("CHS 88.9x6.3", 88.9, 6.3)},
        {"CHS101_6x3_2", chs_row("CHS 101.6x3.2", 101.6, 3.2)},
        {"CHS101_6x4", chs_row("CHS 101.6x4", 101.6, 4)},
        {"CHS101_6x5", chs_row("CHS 101.6x5", 101.6, 5)},
        {"CHS101_6x6_3", chs_row("CHS 101.6x6.3", 101.6, 6.3)},
        {"CHS101_6x8", chs_row("CHS 101.6x8", 101.6, 8)},
        {"CHS101_6x10", chs_row("CHS 101.6x10", 101.6, 10)},
        {"CHS114_3x3_2", chs_row("CHS 114.3x3.2", 114.3, 3.2)},
        {"CHS114_3x4", chs_row("CHS 114.3x4", 114.3, 4)},
        {"CHS114_3x5", chs_row("CHS 114.3x5", 114.3, 5)},
        {"CHS114_3x6_3", chs_row("CHS 114.3x6.3", 114.3, 6.3)},
        {"CHS114_3x8", chs_row("CHS 114.3x8", 114.3, 8)},
        {"CHS114_3x10", chs_row("CHS 114.3x10", 114.3, 10)},
        {"CHS139_7x4", chs_row("CHS 139.7x4", 139.7, 4)},
        {"CHS139_7x5", chs_row("CHS 139.7x5", 139.7, 5)},
        {"CHS139_7x6_3", chs_row("CHS 139.7x6.3", 139.7, 6.3)},
        {"CHS139_7x8", chs_row("CHS 139.7x8", 139.7, 8)},
        {"CHS139_7x10", chs_row("CHS 139.7x10", 139.7, 10)},
        {"CHS139_7x12_5", chs_row("CHS 139.7x12.5", 139.7, 12.5)},
        {"CHS168_3x4", chs_row("CHS 168.3x4", 168.3, 4)},
        {"CHS168_3x5", chs_row("CHS 168.3x5", 168.3, 5)},
        {"CHS168_3x6_3", chs_row("CHS 168.3x6.3", 168.3, 6.3)},
        {"CHS168_3x8", chs_row("CHS 168.3x8", 168.3, 8)},
        {"CHS168_3x10", chs_row("CHS 168.3x10", 168.3, 10)},
        {"CHS168_3x12_5", chs_row("CHS 168.3x12.5", 168.3, 12.5)},
        {"CHS177_8x5", chs_row("CHS 177.8x5", 177.8, 5)},
        {"CHS177_8x6_3", chs_row("CHS 177.8x6.3", 177.8, 6.3)},
        {"CHS177_8x8", chs_row("CHS 177.8x8", 177.8, 8)},
        {"CHS177_8x10", chs_row("CHS 177.8x10", 177.8, 10)},
        {"CHS177_8x12_5", chs_row("CHS 177.8x12.5", 177.8, 12.5)},
        {"CHS193_7x5", chs_row("CHS 193.7x5", 193.7, 5)},
        {"CHS193_7x6_3", chs_row("CHS 193.7x6.3", 193.7, 6.3)},
        {"CHS193_7x8", chs_row("CHS 193.7x8", 193.7, 8)},
        {"CHS193_7x10", chs_row("CHS 193.7x10", 193.7, 10)},
        {"CHS193_7x12_5", chs_row("CHS 193.7x12.5", 193.7, 12.5)},
        {"CHS193_7x14_2", chs_row("CHS 193.7x14.2", 193.7, 14.2)},
        {"CHS193_7x16", chs_row("CHS 193.7x16", 193.7, 16)},
        {"CHS219_1x5", chs_row("CHS 219.1x5", 219.1, 5)},
        {"CHS219_1x6_3", chs_row("CHS 219.1x6.3", 219.1, 6.3)},
        {"CHS219_1x8", chs_row("CHS 219.1x8", 219.1, 8)},
        {"CHS219_1x10", chs_row("CHS 219.1x10", 219.1, 10)},
        {"CHS219_1x12_5", chs_row("CHS 219.1x12.5", 219.1, 12.5)},
        {"CHS219_1x14_2", chs_row("CHS 219.1x14.2", 219.1, 14.2)},
        {"CHS219_1x16", chs_row("CHS 219.1x16", 219.1, 16)},
        {"CHS219_1x20", chs_row("CHS 219.1x20", 219.1, 20)},
        {"CHS244_5x5", chs_row("CHS 244.5x5", 244.5, 5)},
        {"CHS244_5x6_3", chs_row("CHS 244.5x6.3", 244.5, 6.3)},
        {"CHS244_5x8", chs_row("CHS 244.5x8", 244.5, 8)},
        {"CHS244_5x10", chs_row("CHS 244.5x10", 244.5, 10)},
        {"CHS244_5x12_5", chs_row("CHS 244.5x12.5", 244.5, 12.5)},
        {"CHS244_5x14_2", chs_row("CHS 244.5x14.2", 244.5, 14.2)},
        {"CHS244_5x16", chs_row("CHS 244.5x16", 244.5, 16)},
        {"CHS244_5x20", chs_row("CHS 244.5x20", 244.5, 20)},
        {"CHS244_5x25", chs_row("CHS 244.5x25", 244.5, 25)},
        {"CHS273x5", chs_row("CHS 273x5", 273, 5)},
        {"CHS273x6_3", chs_row("CHS 273x6.3", 273, 6.3)},
        {"CHS273x8", chs_row("CHS 273x8", 273, 8)},
        {"CHS273x10", chs_row("CHS 273x10", 273, 10)},
        {"CHS273x12_5", chs_row("CHS 273x12.5", 273, 12.5)},
        {"CHS273x14_2", chs_row("CHS 273x14.2", 273, 14.2)},
        {"CHS273x16", chs_row("CHS 273x16", 273, 16)},
        {"CHS273x20", chs_row("CHS 273x20", 273, 20)},
        {"CHS273x25", chs_row("CHS 273x25", 273, 25)},
        {"CHS323_9x5", chs_row("CHS 323.9x5", 323.9, 5)},
        {"CHS323_9x6_3", chs_row("CHS 323.9x6.3", 323.9, 6.3)},
        {"CHS323_9x8", chs_row("CHS 323.9x8", 323.9, 8)},
        {"CHS323_9x10", chs_row("CHS 323.9x10", 323.9, 10)},
        {"CHS323_9x12_5", chs_row("CHS 323.9x12.5", 323.9, 12.5)},
        {"CHS323_9x14_2", chs_row("CHS 323.9x14.2", 323.9, 14.2)},
        {"CHS323_9x16", chs_row("CHS 323.9x16", 323.9, 16)},
        {"CHS323_9x20", chs_row("CHS 323.9x20", 323.9, 20)},
        {"CHS323_9x25", chs_row("CHS 323.9x25", 323.9, 25)},
        {"CHS355_6x6_3", chs_row("CHS 355.6x6.3", 355.6, 6.3)},
        {"CHS355_6x8", chs_row("CHS 355.6x8", 355.6, 8)},
        {"CHS355_6x10", chs_row("CHS 355.6x10", 355.6, 10)},
        {"CHS355_6x12_5", chs_row("CHS 355.6x12.5", 355.6, 12.5)},
        {"CHS355_6x14_2", chs_row("CHS 355.6x14.2", 355.6, 14.2)},
        {"CHS355_6x16", chs_row("CHS 355.6x16", 355.6, 16)},
        {"CHS355_6x20", chs_row("CHS 355.6x20", 355.6, 20)},
        {"CHS355_6x25", chs_row("CHS 355.6x25", 355.6, 25)},
        {"CHS406_4x6_3", chs_row("CHS 406.4x6.3", 406.4, 6.3)},
        {"CHS406_4x8", chs_row("CHS 406.4x8", 406.4, 8)},
        {"CHS406_4x10", chs_row("CHS 406.4x10", 406.4, 10)},
        {"CHS406_4x12_5", chs_row("CHS 406.4x12.5", 406.4, 12.5)},
        {"CHS406_4x14_2", chs_row("CHS 406.4x14.2", 406.4, 14.2)},
        {"CHS406_4x16", chs_row("CHS 406.4x16", 406.4, 16)},
        {"CHS406_4x20", chs_row("CHS 406.4x20", 406.4, 20)},
        {"CHS406_4x25", chs_row("CHS 406.4x25", 406.4, 25)},
        {"CHS406_4x30", chs_row("CHS 406.4x30", 406.4, 30)},
        {"CHS406_4x40", chs_row("CHS 406.4x40", 406.4, 40)},
        {"CHS457x6_3", chs_row("CHS 457x6.3", 457, 6.3)},
        {"CHS457x8", chs_row("CHS 457x8", 457, 8)},
        {"CHS457x10", chs_row("CHS 457x10", 457, 10)},
        {"CHS457x12_5", chs_row("CHS 457x12.5", 457, 12.5)},
        {"CHS457x14_2", chs_row("CHS 457x14.2", 457, 14.2)},
        {"CHS457x16", chs_row("CHS 457x16", 457, 16)},
        {"CHS457x20", chs_row("CHS 457x20", 457, 20)},
        {"CHS457x25", chs_row("CHS 457x25", 457, 25)},
        {"CHS457x30", chs_row("CHS 457x30", 457, 30)},
        {"CHS457x40", chs_row("CHS 457x40", 457, 40)},
        {"CHS508x6_3", chs_row("CHS 508x6.3", 508, 6.3)},
        {"CHS508x8", chs_row("CHS 508x8", 508, 8)},
        {"CHS508x10", chs_row("CHS 508x10", 508, 10)},
        {"CHS508x12_5", chs_row("CHS 508x12.5", 508, 12.5)},
        {"CHS508x14_2", chs_row("CHS 508x14.2", 508, 14.2)},
        {"CHS508x16", chs_row("CHS 508x16", 508, 16)},
        {"CHS508x20", chs_row("CHS 508x20", 508, 20)},
        {"CHS508x25", chs_row("CHS 508x25", 508, 25)},
        {"CHS508x30", chs_row("CHS 508x30", 508, 30)},
        {"CHS508x40", chs_row("CHS 508x40", 508, 40)},
        {"CHS610x6_3", chs_row("CHS 610x6.3", 610, 6.3)},
        {"CHS610x8", chs_row("CHS 610x8", 610, 8)},
        {"CHS610x10", chs_row("CHS 610x10", 610, 10)},
        {"CHS610x12_5", chs_row("CHS 610x12.5", 610, 12.5)},
        {"CHS610x14_2", chs_row("CHS 610x14.2", 610, 14.2)},
        {"CHS610x16", chs_row("CHS 610x16", 610, 16)},
        {"CHS610x20", chs_row("CHS 610x20", 610, 20)},
        {"CHS610x25", chs_row("CHS 610x25", 610, 25)},
        {"CHS610x30", chs_row("CHS 610x30", 610, 30)},
        {"CHS610x40", chs_row("CHS 610x40", 610, 40)},
        {"CHS711x6_3", chs_row("CHS 711x6.3", 711, 6.3)},
        {"CHS711x8", chs_row("CHS 711x8", 711, 8)},
        {"CHS711x10", chs_row("CHS 711x10", 711, 10)},
        {"CHS711x12_5", chs_row("CHS 711x12.5", 711, 12.5)},
        {"CHS711x14_2", chs_row("CHS 711x14.2", 711, 14.2)},
        {"CHS711x16", chs_row("CHS 711x16", 711, 16)},
        {"CHS711x20", chs_row("CHS 711x20", 711, 20)},
        {"CHS711x25", chs_row("CHS 711x25", 711, 25)},
        {"CHS711x30", chs_row("CHS 711x30", 711, 30)},
        {"CHS711x40", chs_row("CHS 711x40", 711, 40)},
        {"CHS762x6_3", chs_row("CHS 762x6.3", 762, 6.3)},
        {"CHS762x8", chs_row("CHS 762x8", 762, 8)},
        {"CHS762x10", chs_row("CHS 762x10", 762, 10)},
        {"CHS762x12_5", chs_row("CHS 762x12.5", 762, 12.5)},
        {"CHS762x14_2", chs_row("CHS 762x14.2", 762, 14.2)},
        {"CHS762x16", chs_row("CHS 762x16", 762, 16)},
        {"CHS762x20", chs_row("CHS 762x20", 762, 20)},
        {"CHS762x25", chs_row("CHS 762x25", 762, 25)},
        {"CHS762x30", chs_row("CHS 762x30", 762, 30)},
        {"CHS762x40", chs_row("CHS 762x40", 762, 40)},
        {"CHS813x8", chs_row("CHS 813x8", 813, 8)},
        {"CHS813x10", chs_row("CHS 813x10", 813, 10)},
        {"CHS813x12_5", chs_row("CHS 813x12.5", 813, 12.5)},
        {"CHS813x14_2", chs_row("CHS 813x14.2", 813, 14.2)},
        {"CHS813x16", chs_row("CHS 813x16", 813, 16)},
        {"CHS813x20", chs_row("CHS 813x20", 813, 20)},
        {"CHS813x25", chs_row("CHS 813x25", 813, 25)},
        {"CHS813x30", chs_row("CHS 813x30", 813, 30)},
        {"CHS914x8", chs_row("CHS 914x8", 914, 8)},
        {"CHS914x10", chs_row("CHS 914x10", 914, 10)},
        {"CHS914x12_5", chs_row("CHS 914x12.5", 914, 12.5)},
        {"CHS914x14_2", chs_row("CHS 914x14.2", 914, 14.2)},
        {"CHS914x16", chs_row("CHS 914x16", 914, 16)},
        {"CHS914x20", chs_row("CHS 914x20", 914, 20)},
        {"CHS914x25", chs_row("CHS 914x25", 914, 25)},
        {"CHS914x30", chs_row("CHS 914x30", 914, 30)},
        {"CHS1016x8", chs_row("CHS 1016x8", 1016, 8)},
        {"CHS1016x10", chs_row("CHS 1016x10", 1016, 10)},
        {"CHS1016x12_5", chs_row("CHS 1016x12.5", 1016, 12.5)},
        {"CHS1016x14_2", chs_row("CHS 1016x14.2", 1016, 14.2)},
        {"CHS1016x16", chs_row("CHS 1016x16", 1016, 16)},
        {"CHS1016x20", chs_row("CHS 1016x20", 1016, 20)},
        {"CHS1016x25", chs_row("CHS 1016x25", 1016, 25)},
        {"CHS1016x30", chs_row("CHS 1016x30", 1016, 30)},
        {"CHS1067x10", chs_row("CHS 1067x10", 1067, 10)},
        {"CHS1067x12_5", chs_row("CHS 1067x12.5", 1067, 12.5)},
        {"CHS1067x14_2", chs_row("CHS 1067x14.2", 1067, 14.2)},
        {"CHS1067x16", chs_row("CHS 1067x16", 1067, 16)},
        {"CHS1067x20", chs_row("CHS 1067x20", 1067, 20)},
        {"CHS1067x25", chs_row("CHS 1067x25", 1067, 25)},
        {"CHS1067x30", chs_row("CHS 1067x30", 1067, 30)},
        {"CHS1168x10", chs_row("CHS 1168x10", 1168, 10)},
        {"CHS1168x12_5", chs_row("CHS 1168x12.5", 1168, 12.5)},
        {"CHS1168x14_2", chs_row("CHS 1168x14.2", 1168, 14.2)},
        {"CHS1168x16", chs_row("CHS 1168x16", 1168, 16)},
        {"CHS1168x20", chs_row("CHS 1168x20", 1168, 20)},
        {"CHS1168x25", chs_row("CHS 1168x25", 1168, 25)},
        {"CHS1219x10", chs_row("CHS 1219x10", 1219, 10)},
        {"CHS1219x12_5", chs_row("CHS 1219x12.5", 1219, 12.5)},
        {"CHS1219x14_2", chs_row("CHS 1219x14.2", 1219, 14.2)},
        {"CHS1219x16", chs_row("CHS 1219x16", 1219, 16)},
        {"CHS1219x20", chs_row("CHS 1219x20", 1219, 20)},
        {"CHS1219x25", chs_row("CHS 1219x25", 1219, 25)},
        {"CHS1219x30", chs_row("CHS 1219x30", 1219, 30)},
        {"CHS1219x32", chs_row("CHS 1219x32", 1219, 32)},
        {"CHS1219x36", chs_row("CHS 1219x36", 1219, 36)},
        {"CHS1219x40", chs_row("CHS 1219x40", 1219, 40)},
        {"CHS1420x10", chs_row("CHS 1420x10", 1420, 10)},
        {"CHS1420x12_5", chs_row("CHS 1420x12.5", 1420, 12.5)},
        {"CHS1420x14_2", chs_row("CHS 1420x14.2", 1420, 14.2)},
        {"CHS1420x16", chs_row("CHS 1420x16", 1420, 16)},
        {"CHS1420x20", chs_row("CHS 1420x20", 1420, 20)},
        {"CHS1420x25", chs_row("CHS 1420x25", 1420, 25)},
        {"CHS1420x30", chs_row("CHS 1420x30", 1420, 30)},
        {"CHS1420x32", chs_row("CHS 1420x32", 1420, 32)},
        {"CHS1420x36", chs_row("CHS 1420x36", 1420, 36)},
        {"CHS1420x40", chs_row("CHS 1420x40", 1420, 40)},
        {"CHS1620x10", chs_row("CHS 1620x10", 1620, 10)},
        {"CHS1620x12_5", chs_row("CHS 1620x12.5", 1620, 12.5)},
        {"CHS1620x14_2", chs_row("CHS 1620x14.2", 1620, 14.2)},
        {"CHS1620x16", chs_row("CHS 1620x16", 1620, 16)},
        {"CHS1620x20", chs_row("CHS 1620x20", 1620, 20)},
        {"CHS1620x25", chs_row("CHS 1620x25", 1620, 25)},
        {"CHS1620x30", chs_row("CHS 1620x30", 1620, 30)},
        {"CHS1620x32", chs_row("CHS 1620x32", 1620, 32)},
        {"CHS1620x36", chs_row("CHS 1620x36", 1620, 36)},
        {"CHS1620x40", chs_row("CHS 1620x40", 1620, 40)},
        {"CHS1820x12_5", chs_row("CHS 1820x12.5", 1820, 12.5)},
        {"CHS1820x14_2", chs_row("CHS 1820x14.2", 1820, 14.2)},
        {"CHS1820x16", chs_row("CHS 1820x16", 1820, 16)},
        {"CHS1820x20", chs_row("CHS 1820x20", 1820, 20)},
        {"CHS1820x25", chs_row("CHS 1820x25", 1820, 25)},
        {"CHS1820x30", chs_row("CHS 1820x30", 1820, 30)},
        {"CHS1820x32", chs_row("CHS 1820x32", 1820, 32)},
        {"CHS1820x36", chs_row("CHS 1820x36", 1820, 36)},
        {"CHS1820x40", chs_row("CHS 1820x40", 1820, 40)},
        {"CHS2020x14_2", chs_row("CHS 2020x14.2", 2020, 14.2)},
        {"CHS2020x16", chs_row("CHS 2020x16", 2020, 16)},
        {"CHS2020x20", chs_row("CHS 2020x20", 2020, 20)},
        {"CHS2020x25", chs_row("CHS 2020x25", 2020, 25)},
        {"CHS2020x30", chs_row("CHS 2020x30", 2020, 30)},
        {"CHS2020x32", chs_row("CHS 2020x32", 2020, 32)},
        {"CHS2020x36", chs_row("CHS 2020x36", 2020, 36)},
        {"CHS2020x40", chs_row("CHS 2020x40", 2020, 40)},
        {"CHS2220x14_2", chs_row("CHS 2220x14.2", 2220, 14.2)},
        {"CHS2220x16", chs_row("CHS 2220x16", 2220, 16)},
        {"CHS2220x20", chs_row("CHS 2220x20", 2220, 20)},
        {"CHS2220x25", chs_row("CHS 2220x25", 2220, 25)},
        {"CHS2220x30", chs_row("CHS 2220x30", 2220, 30)},
        {"CHS2220x32", chs_row("CHS 2220x32", 2220, 32)},
        {"CHS2220x36", chs_row("CHS 2220x36", 2220, 36)},
        {"CHS2220x40", chs_row("CHS 2220x40", 2220, 40)},
    };
    return table;
}

const CatalogTable<LNPDimensions>& lnp_table() {
    static const CatalogTable<LNPDimensions> table = {
        {"LNP40x40x4", lnp_row("LNP 40x40x4", 40, 40, 4, 4, 6, 0, 3, 3)},
        {"LNP40x40x5", lnp_row("LNP 40x40x5", 40, 40, 5, 5, 6, 0, 3, 3)},
        {"LNP45x45x5", lnp_row("LNP 45x45x5", 45, 45, 5, 5, 7, 0, 3.5, 3.5)},
        {"LNP50x50x5", lnp_row("LNP 50x50x5", 50, 50, 5, 5, 7, 0, 3.5, 3.5)},
        {"LNP50x50x6", lnp_row("LNP 50x50x6", 50, 50, 6, 6, 7, 0, 3.5, 3.5)},
        {"LNP50x50x8", lnp_row("LNP 50x50x8", 50, 50, 8, 8, 7, 0, 3.5, 3.5)},
        {"LNP50x30x4", lnp_row("LNP 50x30x4", 50, 30, 4, 4, 5, 0, 2.5, 2.5)},
        {"LNP50x30x5", lnp_row("LNP 50x30x5", 50, 30, 5, 5, 5, 0, 2.5, 2.5)},
        {"LNP55x55x6", lnp_row("LNP 55x55x6", 55, 55, 6, 6, 8, 0, 4, 4)},
        {"LNP60x60x6", lnp_row("LNP 60x60x6", 60, 60, 6, 6, 8, 0, 4, 4)},
        {"LNP60x60x8", lnp_row("LNP 60x60x8", 60, 60, 8, 8, 8, 0, 4, 4)},
        {"LNP60x60x10", lnp_row("LNP 60x60x10", 60, 60, 10, 10, 8, 0, 4, 4)},
        {"LNP60x30x5", lnp_row("LNP 60x30x5", 60, 30, 5, 5, 5, 0, 2.5, 2.5)},
        {"LNP60x30x7", lnp_row("LNP 60x30x7", 60, 30, 7, 7, 5, 0, 2.5, 2.5)},
        {"LNP60x40x5", lnp_row("LNP 60x40x5", 60, 40, 5, 5, 6, 0, 3, 3)},
        {"LNP60x40x6", lnp_row("LNP 60x40x6", 60, 40, 6, 6, 6, 0, 3, 3)},
        {"LNP60x40x7", lnp_row("LNP 60x40x7", 60, 40, 7, 7, 6, 0, 3, 3)},
        {"LNP65x65x7", lnp_row("LNP 65x65x7", 65, 65, 7, 7, 9, 0, 4.5, 4.5)},
        {"LNP70x70x7", lnp_row("LNP 70x70x7", 70, 70, 7, 7, 9, 0, 4.5, 4.5)},
        {"LNP70x70x9", lnp_row("LNP 70x70x9", 70, 70, 9, 9, 9, 0, 4.5, 4.5)},
        {"LNP70x50x6", lnp_row("LNP 70x50x6", 70, 50, 6, 6, 7, 0, 3.5, 3.5)},
        {"LNP75x75x8", lnp_row("LNP 75x75x8", 75, 75, 8, 8, 9, 0, 4.5, 4.5)},
        {"LNP75x50x6", lnp_row("LNP 75x50x6", 75, 50, 6, 6, 7, 0, 3.5, 3.5)},
        {"LNP75x50x7", lnp_row("LNP 75x50x7", 75, 50, 7, 7, 7, 0, 3.5, 3.5)},
        {"LNP80x80x8", lnp_row("LNP 80x80x8", 80, 80, 8, 8, 10, 0, 5, 5)},
        {"LNP80x80x10", lnp_row("LNP 80x80x10", 80, 80, 10, 10, 10, 0, 5, 5)},
        {"LNP80x80x12", lnp_row("LNP 80x80x12", 80, 80, 12, 12, 10, 0, 5, 5)},
        {"LNP80x40x6", lnp_row("LNP 80x40x6", 80, 40, 6, 6, 7, 0, 3.5, 3.5)},
        {"LNP80x40x8", lnp_row("LNP 80x40x8", 80, 40, 8, 8, 7, 0, 3.5, 3.5)},
        {"LNP90x90x9", lnp_row("LNP 90x90x9", 90, 90, 9, 9, 11, 0, 5.5, 5.5)},
        {"LNP90x60x6", lnp_row("LNP 90x60x6", 90, 60, 6, 6, 7, 0, 3.5, 3.5)},
        {"LNP90x60x8", lnp_row("LNP 90x60x8", 90, 60, 8, 8, 7, 0, 3.5, 3.5)},
        {"LNP100x100x10", lnp_row("LNP 100x100x10", 100, 100, 10, 10, 12, 0, 6, 6)},
        {"LNP100x100x12", lnp_row("LNP 100x100x12", 100, 100, 12, 12, 12, 0, 6, 6)},
        {"LNP100x100x14", lnp_row("LNP 100x100x14", 100, 100, 14, 14, 12, 0, 6, 6)},
        {"LNP100x50x6", lnp_row("LNP 100x50x6", 100, 50, 6, 6, 8, 0, 4, 4)},
        {"LNP100x50x8", lnp_row("LNP 100x50x8", 100, 50, 8, 8, 8, 0, 4, 4)},
        {"LNP100x50x10", lnp_row("LNP 100x50x10", 100, 50, 10, 10, 8, 0, 4, 4)},
        {"LNP100x65x7", lnp_row("LNP 100x65x7", 100, 65, 7, 7, 10, 0, 5, 5)},
        {"LNP100x65x9", lnp_row("LNP 100x65x9", 100, 65, 9, 9, 10, 0, 5, 5)},
        {"LNP100x65x11", lnp_row("LNP 100x65x11", 100, 65, 11, 11, 10, 0, 5, 5)},
        {"LNP100x75x9", lnp_row("LNP 100x75x9", 100, 75, 9, 9, 10, 0, 5, 5)},
        {"LNP110x110x10", lnp_row("LNP 110x110x10", 110, 110, 10, 10, 12, 0, 6, 6)},
        {"LNP120x120x10", lnp_row("LNP 120x120x10", 120, 120, 10, 10, 13, 0, 6.5, 6.5)},
        {"LNP120x120x12", lnp_row("LNP 120x120x12", 120, 120, 12, 12, 13, 0, 6.5, 6.5)},
        {"LNP120x120x15", lnp_row("LNP 120x120x15", 120, 120, 15, 15, 13, 0, 6.5, 6.5)},
        {"LNP120x80x8", lnp_row("LNP 120x80x8", 120, 80, 8, 8, 11, 0, 5.5, 5.5)},
        {"LNP120x80x10", lnp_row("LNP 120x80x10", 120, 80, 10, 10, 11, 0, 5.5, 5.5)},
        {"LNP120x80x12", lnp_row("LNP 120x80x12", 120, 80, 12, 12, 11, 0, 5.5, 5.5)},
        {"LNP130x130x12", lnp_row("LNP 130x130x12", 130, 130, 12, 12, 14, 0, 7, 7)},
        {"LNP130x65x8", lnp_row("LNP 130x65x8", 130, 65, 8, 8, 11, 0, 5.5, 5.5)},
        {"LNP130x65x10", lnp_row("LNP 130x65x10", 130, 65, 10, 10, 11, 0, 5.5, 5.5)},
        {"LNP130x65x12", lnp_row("LNP 130x65x12", 130, 65, 12, 12, 11, 0, 5.5, 5.5)},
        {"LNP140x140x13", lnp_row("LNP 140x140x13", 140, 140, 13, 13, 15, 0, 7.5, 7.5)},
        {"LNP140x140x15", lnp_row("LNP 140x140x15", 140, 140, 15, 15, 15, 0, 7.5, 7.5)},
        {"LNP150x150x14", lnp_row("LNP 150x150x14", 150, 150, 14, 14, 16, 0, 8, 8)},
        {"LNP150x150x16", lnp_row("LNP 150x150x16", 150, 150, 16, 16, 16, 0, 8, 8)},
        {"LNP150x75x9", lnp_row("LNP 150x75x9", 150, 75, 9, 9, 12, 0, 6, 6)},
        {"LNP150x75x11", lnp_row("LNP 150x75x11", 150, 75, 11, 11, 10.5, 0, 5.5, 5.5)},
        {"LNP150x100x10", lnp_row("LNP 150x100x10", 150, 100, 10, 10, 12, 0, 6, 6)},
        {"LNP150x100x12", lnp_row("LNP 150x100x12", 150, 100, 12, 12, 12, 0, 6, 6)},
        {"LNP150x100x14", lnp_row("LNP 150x100x14", 150, 100, 14, 14, 13, 0, 6.5, 6.5)},
        {"LNP160x160x15", lnp_row("LNP 160x160x15", 160, 160, 15, 15, 17, 0, 8.5, 8.5)},
        {"LNP160x160x17", lnp_row("LNP 160x160x17", 160, 160, 17, 17, 17, 0, 8.5, 8.5)},
        {"LNP160x160x20", lnp_row("LNP 160x160x20", 160, 160, 20, 20, 17, 0, 8.5, 8.5)},
        {"LNP160x80x10", lnp_row("LNP 160x80x10", 160, 80, 10, 10, 13, 0, 6.5, 6.5)},
        {"LNP160x80x12", lnp_row("LNP 160x80x12", 160, 80, 12, 12, 13, 0, 6.5, 6.5)},
        {"LNP160x80x14", lnp_row("LNP 160x80x14", 160, 80, 14, 14, 13, 0, 6.5, 6.5)},
        {"LNP180x180x16", lnp_row("LNP 180x180x16", 180, 180, 16, 16, 18, 0, 9, 9)},
        {"LNP180x180x18", lnp_row("LNP 180x180x18", 180, 180, 18, 18, 18, 0, 9, 9)},
        {"LNP180x180x20", lnp_row("LNP 180x180x20", 180, 180, 20, 20, 18, 0, 9, 9)},
        {"LNP200x200x16", lnp_row("LNP 200x200x16", 200, 200, 16, 16, 18, 0, 9, 9)},
        {"LNP200x200x18", lnp_row("LNP 200x200x18", 200, 200, 18, 18, 18, 0, 9, 9)},
        {"LNP200x200x20", lnp_row("LNP 200x200x20", 200, 200, 20, 20, 18, 0, 9, 9)},
        {"LNP200x200x22", lnp_row("LNP 200x200x22", 200, 200, 22, 22, 18, 0, 9, 9)},
        {"LNP200x200x24", lnp_row("LNP 200x200x24", 200, 200, 24, 24, 18, 0, 9, 9)},
        {"LNP200x200x26", lnp_row("LNP 200x200x26", 200, 200, 26, 26, 18, 0, 9, 9)},
        {"LNP200x100x10", lnp_row("LNP 200x100x10", 200, 100, 10, 10, 15, 0, 7.5, 7.5)},
        {"LNP200x100x12", lnp_row("LNP 200x100x12", 200, 100, 12, 12, 15, 0, 7.5, 7.5)},
        {"LNP200x100x14", lnp_row("LNP 200x100x14", 200, 100, 14, 14, 15, 0, 7.5, 7.5)},
        {"LNP200x100x16", lnp_row("LNP 200x100x16", 200, 100, 16, 16, 15, 0, 7.5, 7.5)},
    };
    return table;
}

const CatalogTable<UNPDimensions>& unp_table() {
    static const CatalogTable<UNPDimensions> table = {
        {"UNP80", unp_row("UNP80", 80, 45, 6, 8, 8, 4)},
        {"UNP100", unp_row("UNP100", 100, 50, 6, 8.5, 8.5, 4.5)},
        {"UNP120", unp_row("UNP120", 120, 55, 7, 9, 9, 4.5)},
        {"UNP140", unp_row("UNP140", 140, 60, 7, 10, 10, 5)},
        {"UNP160", unp_row("UNP160", 160, 65, 7.5, 10.5, 10.5, 5.5)},
        {"UNP180", unp_row("UNP180", 180, 70, 8, 11, 11, 5.5)},
        {"UNP200", unp_row("UNP200", 200, 75, 8.5, 11.5, 11.5, 6)},
        {"UNP220", unp_row("UNP220", 220, 80, 9, 12.5, 12.5, 6.5)},
        {"UNP240", unp_row("UNP240", 240, 85, 9.5, 13, 13, 6.5)},
        {"UNP260", unp_row("UNP260", 260, 90, 10, 14, 14, 7)},
        {"UNP280", unp_row("UNP280", 280, 95, 10, 15, 15, 7.5)},
        {"UNP300", unp_row("UNP300", 300, 100, 10, 16, 16, 8)},
    };
    return table;
}

const CatalogTable<StripDimensions>& strip_table() {
    static const CatalogTable<StripDimensions> table = {
        {"STRIP160x5", strip_row("160x5", 160, 5)},
        {"STRIP160x6", strip_row("160x6", 160, 6)},
        {"STRIP160x8", strip_row("160x8", 160, 8)},
        {"STRIP160x10", strip_row("160x10", 160, 10)},
        {"STRIP160x12", strip_row("160x12", 160, 12)},
        {"STRIP160x15", strip_row("160x15", 160, 15)},
        {"STRIP160x20", strip_row("160x20", 160, 20)},
        {"STRIP160x25", strip_row("160x25", 160, 25)},
        {"STRIP160x30", strip_row("160x30", 160, 30)},
        {"STRIP165x5", strip_row("165x5", 165, 5)},
        {"STRIP165x6", strip_row("165x6", 165, 6)},
        {"STRIP165x8", strip_row("165x8", 165, 8)},
        {"STRIP165x10", strip_row("165x10", 165, 10)},
        {"STRIP165x12", strip_row("165x12", 165, 12)},
        {"STRIP165x15", strip_row("165x15", 165, 15)},
        {"STRIP165x20", strip_row("165x20", 165, 20)},
        {"STRIP165x25", strip_row("165x25", 165, 25)},
        {"STRIP165x30", strip_row("165x30", 165, 30)},
        {"STRIP170x5", strip_row("170x5", 170, 5)},
        {"STRIP170x6", strip_row("170x6", 170, 6)},
        {"STRIP170x8", strip_row("170x8", 170, 8)},
        {"STRIP170x10", strip_row("170x10", 170, 10)},
        {"STRIP170x12", strip_row("170x12", 170, 12)},
        {"STRIP170x15", strip_row("170x15", 170, 15)},
        {"STRIP170x20", strip_row("170x20", 170, 20)},
        {"STRIP180x5", strip_row("180x5", 180, 5)},
        {"STRIP180x6", strip_row("180x6", 180, 6)},
        {"STRIP180x8", strip_row("180x8", 180, 8)},
        {"STRIP180x10", strip_row("180x10", 180, 10)},
        {"STRIP180x12", strip_row("180x12", 180, 12)},
        {"STRIP180x15", strip_row("180x15", 180, 15)},
        {"STRIP180x20", strip_row("180x20", 180, 20)},
        {"STRIP180x25", strip_row("180x25", 180, 25)},
        {"STRIP180x30", strip_row("180x30", 180, 30)},
        {"STRIP180x40", strip_row("180x40", 180, 40)},
        {"STRIP180x50", strip_row("180x50", 180, 50)},
        {"STRIP200x5", strip_row("200x5", 200, 5)},
        {"STRIP200x6", strip_row("200x6", 200, 6)},
        {"STRIP200x8", strip_row("200x8", 200, 8)},
        {"STRIP200x10", strip_row("200x10", 200, 10)},
        {"STRIP200x12", strip_row("200x12", 200, 12)},
        {"STRIP200x15", strip_row("200x15", 200, 15)},
        {"STRIP200x20", strip_row("200x20", 200, 20)},
        {"STRIP200x25", strip_row("200x25", 200, 25)},
        {"STRIP200x30", strip_row("200x30", 200, 30)},
        {"STRIP200x40", strip_row("200x40", 200, 40)},
        {"STRIP200x50", strip_row("200x50", 200, 50)},
        {"STRIP220x6", strip_row("220x6", 220, 6)},
        {"STRIP220x8", strip_row("220x8", 220, 8)},
        {"STRIP220x10", strip_row("220x10", 220, 10)},
        {"STRIP220x12", strip_row("220x12", 220, 12)},
        {"STRIP220x15", strip_row("220x15", 220, 15)},
        {"STRIP220x20", strip_row("220x20", 220, 20)},
        {"STRIP220x25", strip_row("220x25", 220, 25)},
        {"STRIP220x30", strip_row("220x30", 220, 30)},
        {"STRIP230x6", strip_row("230x6", 230, 6)},
        {"STRIP230x8", strip_row("230x8", 230, 8)},
        {"STRIP230x10", strip_row("230x10", 230, 10)},
        {"STRIP230x12", strip_row("230x12", 230, 12)},
        {"STRIP230x15", strip_row("230x15", 230, 15)},
        {"STRIP230x20", strip_row("230x20", 230, 20)},
        {"STRIP230x25", strip_row("230x25", 230, 25)},
    };
    return table;
}

std::shared_ptr<const RHSProfile> rhs(const std::string& name) {
    return lookup<RHSProfile>(rhs_table(), name);
}

std::shared_ptr<const RHSProfile> shs(const std::string& name) {
    return lookup<RHSProfile>(shs_table(), name);
}

std::shared_ptr<const CHSProfile> chs(const std::string& name) {
    return lookup<CHSProfile>(chs_table(), name);
}

std::shared_ptr<const LNPProfile> lnp(const std::string& name) {
    return lookup<LNPProfile>(lnp_table(), name);
}

std::shared_ptr<const UNPProfile> unp(const std::string& name) {
    return lookup<UNPProfile>(unp_table(), name);
}

std::shared_ptr<const StripProfile> strip(const std::string& name) {
    return lookup<StripProfile>(strip_table(), name);
}

std::shared_ptr<const Profile> from_standard(const std::string& name) {
    if (find_entry(rhs_table(), name)) return rhs(name);
    if (find_entry(shs_table(), name)) return shs(name);
    if (find_entry(chs_table(), name)) return chs(name);
    if (find_entry(lnp_table(), name)) return lnp(name);
    if (find_entry(unp_table(), name)) return unp(name);
    if (find_entry(strip_table(), name)) return strip(name);

    logging::get_logger()->warn("Catalog: no standard profile named '{}'", name);
    throw ProfileNotFoundError(name);
}

std::optional<std::string> find_key(const std::string& name) {
    if (auto key = key_of(rhs_table(), name)) return key;
    if (auto key = key_of(shs_table(), name)) return key;
    if (auto key = key_of(chs_table(), name)) return key;
    if (auto key = key_of(lnp_table(), name)) return key;
    if (auto key = key_of(unp_table(), name)) return key;
    return key_of(strip_table(), name);
}

std::vector<std::string> keys(const std::string& family) {
    std::string f = normalize_key(family);
    if (f == "RHS") return table_keys(rhs_table());
    if (f == "SHS") return table_keys(shs_table());
    if (f == "CHS") return table_keys(chs_table());
    if (f == "LNP") return table_keys(lnp_table());
    if (f == "UNP") return table_keys(unp_table());
    if (f == "STRIP") return table_keys(strip_table());
    throw ValidationError("Unknown profile family: " + family);
}

}  // namespace sectionpath::catalog
