#ifndef SECTIONPATH_CATALOG_STANDARD_PROFILES_HPP
#define SECTIONPATH_CATALOG_STANDARD_PROFILES_HPP

#include "profiles.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sectionpath::catalog {

// Tabulated dimensions of a commercially standardized section
template <typename Dimensions>
struct CatalogEntry {
    std::string name;  // display name, e.g. "RHS50x30x2.6" or "CHS 21.3x2.3"
    Dimensions dimensions;
};

// Keyed by identifier-safe catalog key, e.g. "RHS50x30x2_6"
template <typename Dimensions>
using CatalogTable = std::map<std::string, CatalogEntry<Dimensions>>;

const CatalogTable<RHSDimensions>& rhs_table();
const CatalogTable<RHSDimensions>& shs_table();
const CatalogTable<CHSDimensions>& chs_table();
const CatalogTable<LNPDimensions>& lnp_table();
const CatalogTable<UNPDimensions>& unp_table();
const CatalogTable<StripDimensions>& strip_table();

// Lookups by key or display name; throw ProfileNotFoundError
std::shared_ptr<const RHSProfile> rhs(const std::string& name);
std::shared_ptr<const RHSProfile> shs(const std::string& name);
std::shared_ptr<const CHSProfile> chs(const std::string& name);
std::shared_ptr<const LNPProfile> lnp(const std::string& name);
std::shared_ptr<const UNPProfile> unp(const std::string& name);
std::shared_ptr<const StripProfile> strip(const std::string& name);

// Any family; the profile is named with the catalog display name
std::shared_ptr<const Profile> from_standard(const std::string& name);

// Catalog key of the entry a key or display name refers to, if any
std::optional<std::string> find_key(const std::string& name);

// Catalog keys of one family ("RHS", "SHS", "CHS", "LNP", "UNP", "STRIP"), in key order
std::vector<std::string> keys(const std::string& family);

// Uppercases, drops spaces and maps '.' to '_': "CHS 21.3x2.3" -> "CHS21_3X2_3"
std::string normalize_key(const std::string& name);

}  // namespace sectionpath::catalog

#endif // SECTIONPATH_CATALOG_STANDARD_PROFILES_HPP
