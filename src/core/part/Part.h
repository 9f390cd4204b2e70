/**
 * @file Part.h
 * @brief Named geometry plus descriptive parameters
 *
 * Parameters mirror the arguments a primitive was created with. They are
 * metadata: after a transform they are carried over unchanged even though the
 * geometry became an opaque mesh, and parts produced by booleans carry none.
 */
#ifndef PARTCAD_CORE_PART_PART_H
#define PARTCAD_CORE_PART_PART_H

#include "../geometry/Geometry.h"

#include <gp_Vec.hxx>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace partcad::core::part {

using ParameterMap = std::map<std::string, double>;

namespace params {
constexpr const char* WIDTH = "width";
constexpr const char* HEIGHT = "height";
constexpr const char* DEPTH = "depth";
constexpr const char* RADIUS = "radius";
} // namespace params

/**
 * @brief Parameter names a primitive of @p type is created with (empty for Mesh)
 */
std::vector<std::string> parameterNames(geometry::GeometryType type);

class Part {
public:
    Part(std::string name, geometry::Geometry geometry, ParameterMap parameters = {});

    /**
     * @brief Box part named "Box" with width/height/depth parameters
     * @throws geometry::GeometryConstructionError on non-positive dimensions
     */
    static Part box(double width, double height, double depth);

    /**
     * @brief Cylinder part named "Cylinder" with radius/height parameters
     */
    static Part cylinder(double radius, double height);

    const std::string& name() const { return name_; }
    void setName(const std::string& name) { name_ = name; }

    const geometry::Geometry& geometry() const { return geometry_; }

    const ParameterMap& parameters() const { return parameters_; }
    ParameterMap& parameters() { return parameters_; }
    std::optional<double> parameter(const std::string& name) const;
    bool hasParameter(const std::string& name) const;
    void setParameter(const std::string& name, double value);

    Part translate(double dx, double dy, double dz) const;
    Part rotate(double angleDeg, const gp_Vec& axis) const;
    Part clone() const;

private:
    std::string name_;
    geometry::Geometry geometry_;
    ParameterMap parameters_;
};

} // namespace partcad::core::part

#endif // PARTCAD_CORE_PART_PART_H
