#ifndef SECTIONPATH_SERIALIZATION_SECTION_DOCUMENT_HPP
#define SECTIONPATH_SERIALIZATION_SECTION_DOCUMENT_HPP

#include <nlohmann/json.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace sectionpath::json {

constexpr int SECTION_DOCUMENT_VERSION = 1;
constexpr const char* SECTION_DOCUMENT_UNITS = "mm";

// One exported section: the definition that rebuilds it, the catalog entry
// it was taken from and what it measured once placed
struct SectionRecord {
    nlohmann::json definition;
    std::optional<std::string> standard;
    nlohmann::json summary;
    std::size_t vertex_count = 0;
    std::size_t hole_count = 0;
};

// Exported sections. Lengths are millimetres and angles degrees.
//
// {
//   "version": 1, "units": "mm", "created_at": "2026-10-19T08:00:00Z",
//   "source_file": "frame.json",
//   "sections": [{"definition": {...}, "standard": "UNP200", "summary": {...},
//                 "vertex_count": 52, "hole_count": 0}]
// }
struct SectionDocument {
    int version = SECTION_DOCUMENT_VERSION;
    std::string units = SECTION_DOCUMENT_UNITS;
    std::string created_at;
    std::string source_file;
    std::vector<SectionRecord> sections;
};

void to_json(nlohmann::json& j, const SectionRecord& record);
void from_json(const nlohmann::json& j, SectionRecord& record);

void to_json(nlohmann::json& j, const SectionDocument& document);

// Throws ValidationError for a newer version or other units than millimetres
void from_json(const nlohmann::json& j, SectionDocument& document);

// Objects carrying a "sections" array; definition files are plain objects or arrays
bool is_section_document(const nlohmann::json& j);

// UTC, ISO 8601
std::string utc_timestamp();

nlohmann::json read_json_file(const std::string& path);
void write_json_file(const std::string& path, const nlohmann::json& j);

void write_document(const std::string& path, const SectionDocument& document);
SectionDocument read_document(const std::string& path);

}  // namespace sectionpath::json

#endif // SECTIONPATH_SERIALIZATION_SECTION_DOCUMENT_HPP
