#ifndef SECTIONPATH_COMMON_ERRORS_HPP
#define SECTIONPATH_COMMON_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace sectionpath {

// Infeasible input parameters, raised before any geometry is built
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message)
        : std::runtime_error(message) {}
};

class NegativeValueError : public ValidationError {
public:
    explicit NegativeValueError(const std::string& message)
        : ValidationError(message) {}
};

class NonPositiveValueError : public ValidationError {
public:
    explicit NonPositiveValueError(const std::string& message)
        : ValidationError(message) {}
};

// A corrosion transform left a thickness at or below the tolerance
class FullyCorrodedError : public std::runtime_error {
public:
    FullyCorrodedError()
        : std::runtime_error("The profile has fully corroded.") {}
};

// Too few points, or a self-intersecting ring
class InvalidPolygonError : public std::runtime_error {
public:
    explicit InvalidPolygonError(const std::string& message)
        : std::runtime_error(message) {}
};

class ProfileNotFoundError : public std::runtime_error {
public:
    explicit ProfileNotFoundError(const std::string& name)
        : std::runtime_error("Unknown standard profile: " + name) {}
};

}  // namespace sectionpath

#endif // SECTIONPATH_COMMON_ERRORS_HPP
