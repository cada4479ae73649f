#include "section_document.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace sectionpath::json {

void to_json(nlohmann::json& j, const SectionRecord& record) {
    j = {
        {"definition", record.definition},
        {"summary", record.summary},
        {"vertex_count", record.vertex_count},
        {"hole_count", record.hole_count}
    };
    if (record.standard) {
        j["standard"] = *record.standard;
    }
}

void from_json(const nlohmann::json& j, SectionRecord& record) {
    record.definition = j.at("definition");
    record.summary = j.value("summary", nlohmann::json::object());
    record.vertex_count = j.value("vertex_count", std::size_t{0});
    record.hole_count = j.value("hole_count", std::size_t{0});
    if (j.contains("standard")) {
        record.standard = j.at("standard").get<std::string>();
    } else {
        record.standard.reset();
    }
}

void to_json(nlohmann::json& j, const SectionDocument& document) {
    j = {
        {"version", document.version},
        {"units", document.units},
        {"sections", document.sections}
    };
    if (!document.created_at.empty()) j["created_at"] = document.created_at;
    if (!document.source_file.empty()) j["source_file"] = document.source_file;
}

void from_json(const nlohmann::json& j, SectionDocument& document) {
    if (!is_section_document(j)) {
        throw ValidationError("Section document needs a 'sections' array");
    }
    document.version = j.value("version", SECTION_DOCUMENT_VERSION);
    if (document.version > SECTION_DOCUMENT_VERSION) {
        throw ValidationError("Unsupported section document version: " +
                              std::to_string(document.version));
    }
    document.units = j.value("units", std::string(SECTION_DOCUMENT_UNITS));
    if (document.units != SECTION_DOCUMENT_UNITS) {
        throw ValidationError("Unsupported units '" + document.units + "', expected mm");
    }
    document.created_at = j.value("created_at", "");
    document.source_file = j.value("source_file", "");
    document.sections = j.at("sections").get<std::vector<SectionRecord>>();
}

bool is_section_document(const nlohmann::json& j) {
    return j.is_object() && j.contains("sections") && j.at("sections").is_array();
}

std::string utc_timestamp() {
    auto time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&time, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path + ": " + e.what());
    }
}

void write_json_file(const std::string& path, const nlohmann::json& j) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << j.dump(2) << '\n';
}

void write_document(const std::string& path, const SectionDocument& document) {
    write_json_file(path, document);
    logging::get_logger()->info("Wrote {} section(s) to {}", document.sections.size(), path);
}

SectionDocument read_document(const std::string& path) {
    return read_json_file(path).get<SectionDocument>();
}

}  // namespace sectionpath::json
