/**
 * @file MeshKernel.h
 * @brief OpenCASCADE-backed tessellation and boolean algebra on closed meshes
 *
 * The kernel exposes a narrow mesh-in/mesh-out contract: primitives are
 * produced as closed triangle meshes, and booleans take two closed meshes and
 * return one. Internally meshes are sewn back into B-rep solids so the OCCT
 * boolean algorithms can be used, and the result is re-meshed.
 */
#ifndef PARTCAD_CORE_MESH_MESHKERNEL_H
#define PARTCAD_CORE_MESH_MESHKERNEL_H

#include "TessellationSettings.h"
#include "TriangleMesh.h"

#include <TopoDS_Shape.hxx>
#include <gp_Dir.hxx>
#include <gp_Vec.hxx>

#include <stdexcept>
#include <string>

namespace partcad::core::mesh {

/**
 * @brief Raised when OCCT throws or an algorithm reports errors
 */
class MeshKernelError : public std::runtime_error {
public:
    explicit MeshKernelError(const std::string& message)
        : std::runtime_error(message) {}
};

enum class BooleanKind {
    Union,
    Difference,
    Intersection
};

class MeshKernel {
public:
    /**
     * @brief Box centred on the origin spanning [-w/2,w/2] x [-h/2,h/2] x [-d/2,d/2]
     */
    static TriangleMesh tessellateBox(double width, double height, double depth,
                                      const TessellationSettings& settings = TessellationSettings::current());

    /**
     * @brief Cylinder along +Z centred on the origin
     *
     * The lateral surface is a regular polygon with @p segments sides starting
     * on +X, so the result is identical for identical inputs.
     * @throws MeshKernelError unless @p segments is a positive multiple of 4
     */
    static TriangleMesh tessellateCylinder(double radius, double height, int segments,
                                           const TessellationSettings& settings = TessellationSettings::current());

    static TriangleMesh booleanUnion(const TriangleMesh& a, const TriangleMesh& b,
                                     const TessellationSettings& settings = TessellationSettings::current());
    static TriangleMesh booleanDifference(const TriangleMesh& a, const TriangleMesh& b,
                                          const TessellationSettings& settings = TessellationSettings::current());
    static TriangleMesh booleanIntersection(const TriangleMesh& a, const TriangleMesh& b,
                                            const TessellationSettings& settings = TessellationSettings::current());
    static TriangleMesh boolean(const TriangleMesh& a, const TriangleMesh& b, BooleanKind kind,
                                const TessellationSettings& settings = TessellationSettings::current());

    /**
     * @brief Mesh a B-rep shape and return its faces as triangles only
     * @return Empty mesh when the shape has no faces (e.g. an empty common)
     */
    static TriangleMesh triangulate(const TopoDS_Shape& shape,
                                    const TessellationSettings& settings = TessellationSettings::current());

    /**
     * @brief Sew a closed triangle mesh into an outward-oriented solid
     */
    static TopoDS_Shape toSolid(const TriangleMesh& mesh,
                                const TessellationSettings& settings = TessellationSettings::current());

    static TriangleMesh translate(const TriangleMesh& mesh, const gp_Vec& offset);

    /**
     * @brief Rotate about an axis through the origin
     */
    static TriangleMesh rotate(const TriangleMesh& mesh, double angleDeg, const gp_Dir& axis);

    static MeshBounds bounds(const TriangleMesh& mesh) { return mesh.bounds(); }
};

inline const char* booleanKindName(BooleanKind kind) {
    switch (kind) {
        case BooleanKind::Union: return "Union";
        case BooleanKind::Difference: return "Difference";
        case BooleanKind::Intersection: return "Intersection";
        default: return "Unknown";
    }
}

} // namespace partcad::core::mesh

#endif // PARTCAD_CORE_MESH_MESHKERNEL_H
