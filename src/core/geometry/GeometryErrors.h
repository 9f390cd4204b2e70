/**
 * @file GeometryErrors.h
 * @brief Exceptions raised by geometry construction, validation and booleans
 */
#ifndef PARTCAD_CORE_GEOMETRY_GEOMETRYERRORS_H
#define PARTCAD_CORE_GEOMETRY_GEOMETRYERRORS_H

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace partcad::core::geometry {

class GeometryError : public std::runtime_error {
public:
    explicit GeometryError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Non-positive or non-finite primitive dimension
 */
class GeometryConstructionError : public GeometryError {
public:
    using GeometryError::GeometryError;
};

/**
 * @brief Externally supplied mesh fails the mesh-validity contract
 */
class GeometryValidationError : public GeometryError {
public:
    using GeometryError::GeometryError;
};

/**
 * @brief Operator name or value is not one of union, difference, intersection
 */
class InvalidOperationError : public GeometryError {
public:
    using GeometryError::GeometryError;
};

/**
 * @brief Any failure while combining two parts
 *
 * The failure that triggered it is kept in cause() so callers can rethrow or
 * inspect it; what() already includes its message.
 */
class BooleanOperationError : public GeometryError {
public:
    BooleanOperationError(const std::string& message, std::exception_ptr cause)
        : GeometryError(message), cause_(std::move(cause)) {}

    std::exception_ptr cause() const { return cause_; }

    void rethrowCause() const {
        if (cause_) {
            std::rethrow_exception(cause_);
        }
    }

private:
    std::exception_ptr cause_;
};

} // namespace partcad::core::geometry

#endif // PARTCAD_CORE_GEOMETRY_GEOMETRYERRORS_H
