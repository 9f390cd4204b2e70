/**
 * @file Geometry.h
 * @brief Solid geometry as a tagged variant with a lazily built tessellation
 *
 * A Geometry is either a parametric primitive (box, cylinder) or an opaque
 * triangle mesh. Primitives are tessellated on first use and the result is
 * cached. Transforms always go through the tessellation and return a new
 * Mesh-kind Geometry; the source object is never modified.
 *
 * Not thread-safe: tessellate() populates the cache through a const method,
 * so concurrent use of one instance must be serialised by the caller.
 */
#ifndef PARTCAD_CORE_GEOMETRY_GEOMETRY_H
#define PARTCAD_CORE_GEOMETRY_GEOMETRY_H

#include "GeometryErrors.h"
#include "../mesh/TriangleMesh.h"

#include <gp_Vec.hxx>

#include <optional>
#include <variant>

namespace partcad::core::geometry {

using mesh::Extents;
using mesh::TriangleMesh;

enum class GeometryType {
    Box,
    Cylinder,
    Mesh
};

struct BoxParams {
    double width = 0.0;
    double height = 0.0;
    double depth = 0.0;
};

struct CylinderParams {
    double radius = 0.0;
    double height = 0.0;
};

// The cached tessellation is the whole description of a Mesh-kind geometry.
struct MeshParams {};

using GeometryKind = std::variant<BoxParams, CylinderParams, MeshParams>;

class Geometry {
public:
    /**
     * @throws GeometryConstructionError if any dimension is not a positive finite number
     */
    static Geometry box(double width, double height, double depth);
    static Geometry cylinder(double radius, double height);

    /**
     * @brief Wrap an externally supplied mesh
     * @throws GeometryValidationError if the mesh has no vertices, no faces,
     *         out-of-range indices or non-finite coordinates
     */
    static Geometry fromMesh(TriangleMesh mesh);

    const GeometryKind& kind() const { return kind_; }
    GeometryType type() const;
    bool isPrimitive() const { return type() != GeometryType::Mesh; }

    std::optional<BoxParams> boxParams() const;
    std::optional<CylinderParams> cylinderParams() const;

    /**
     * @brief Return the cached tessellation, building it on first call
     * @throws GeometryError if the kernel produced an empty mesh
     */
    const TriangleMesh& tessellate() const;
    bool isTessellated() const { return cache_.has_value(); }

    Extents boundingBox() const;

    /**
     * @throws GeometryError if an offset is NaN or infinite
     */
    Geometry translate(double dx, double dy, double dz) const;

    /**
     * @brief Rotate about @p axis through the origin
     * @throws GeometryError for a zero-length or non-finite axis, or a non-finite angle
     */
    Geometry rotate(double angleDeg, const gp_Vec& axis) const;

    /**
     * @brief Deep copy; an untessellated primitive stays a primitive
     */
    Geometry clone() const;

private:
    Geometry(GeometryKind kind, std::optional<TriangleMesh> cache);

    GeometryKind kind_;
    mutable std::optional<TriangleMesh> cache_;
};

const char* geometryTypeName(GeometryType type);

} // namespace partcad::core::geometry

#endif // PARTCAD_CORE_GEOMETRY_GEOMETRY_H
