#ifndef SECTIONPATH_COMMON_VALIDATION_HPP
#define SECTIONPATH_COMMON_VALIDATION_HPP

#include "errors.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <initializer_list>
#include <string>
#include <utility>

namespace sectionpath {

inline void require_non_negative(const std::string& name, double value) {
    if (value < 0.0) {
        throw NegativeValueError(
            fmt::format("Negative values are not allowed: {}={}", name, value));
    }
}

inline void require_non_negative(
    std::initializer_list<std::pair<const char*, double>> values) {
    for (const auto& [name, value] : values) {
        require_non_negative(name, value);
    }
}

inline void require_positive(const std::string& name, double value) {
    if (value <= 0.0) {
        throw NonPositiveValueError(
            fmt::format("Zero or negative values are not allowed: {}={}", name, value));
    }
}

inline void require_finite(const std::string& name, double value) {
    if (!std::isfinite(value)) {
        throw ValidationError(fmt::format("Value must be finite: {}={}", name, value));
    }
}

}  // namespace sectionpath

#endif // SECTIONPATH_COMMON_VALIDATION_HPP
