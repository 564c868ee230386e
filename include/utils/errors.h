#pragma once

#include <stdexcept>
#include <string>

namespace statlas {

/**
 * @brief Base class of every error raised by the catalog, search and
 * materialization layers
 */
class StatlasError : public std::runtime_error {
public:
    explicit StatlasError(const std::string& message)
        : std::runtime_error(message)
    {}
};

/**
 * @brief A file or network fetch failed, or fetched data lacks a required
 * column/property (e.g. the geographic key)
 */
class ResourceError : public StatlasError {
public:
    explicit ResourceError(const std::string& message)
        : StatlasError("Resource error: " + message)
    {}
};

/**
 * @brief Matched rows do not form a materializable request
 * (no metric requests, no geometry file)
 */
class ShapeError : public StatlasError {
public:
    explicit ShapeError(const std::string& message)
        : StatlasError("Invalid request shape: " + message)
    {}
};

/**
 * @brief Request is well-formed but not supported by this release
 * (several geometry files, several region specifications)
 */
class UnsupportedError : public StatlasError {
public:
    explicit UnsupportedError(const std::string& message)
        : StatlasError("Unsupported: " + message)
    {}
};

/**
 * @brief User input rejected while compiling it (year range, bbox, regex, recipe)
 */
class ValidationError : public StatlasError {
public:
    explicit ValidationError(const std::string& message)
        : StatlasError("Validation error: " + message)
    {}
};

} // namespace statlas
