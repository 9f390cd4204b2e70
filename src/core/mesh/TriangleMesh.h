/**
 * @file TriangleMesh.h
 * @brief Closed triangle mesh exchanged between geometry and the mesh kernel
 */
#ifndef PARTCAD_CORE_MESH_TRIANGLEMESH_H
#define PARTCAD_CORE_MESH_TRIANGLEMESH_H

#include <gp_Pnt.hxx>
#include <gp_Trsf.hxx>

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace partcad::core::mesh {

/**
 * @brief Axis-aligned bounds in kernel order (xmin, xmax, ymin, ymax, zmin, zmax)
 */
struct MeshBounds {
    double xmin = 0.0;
    double xmax = 0.0;
    double ymin = 0.0;
    double ymax = 0.0;
    double zmin = 0.0;
    double zmax = 0.0;
};

/**
 * @brief Per-axis extents (max - min)
 */
struct Extents {
    double width = 0.0;   ///< X
    double height = 0.0;  ///< Y
    double depth = 0.0;   ///< Z
};

using Triangle = std::array<int, 3>;

/**
 * @brief Indexed triangle soup
 *
 * Triangles are wound counter-clockwise when seen from outside the solid, so
 * volume() is positive for a correctly oriented closed mesh.
 */
class TriangleMesh {
public:
    TriangleMesh() = default;
    TriangleMesh(std::vector<gp_Pnt> vertices, std::vector<Triangle> triangles);

    int addVertex(const gp_Pnt& point);
    void addTriangle(int a, int b, int c);

    const std::vector<gp_Pnt>& vertices() const { return vertices_; }
    const std::vector<Triangle>& triangles() const { return triangles_; }
    std::size_t vertexCount() const { return vertices_.size(); }
    std::size_t triangleCount() const { return triangles_.size(); }

    bool isEmpty() const { return vertices_.empty() || triangles_.empty(); }

    /**
     * @brief Check the mesh-validity contract
     * @param reason Receives a short description when invalid
     * @return true for a non-empty mesh with finite coordinates whose indices are all in range
     *
     * Manifoldness is not checked; intermediate boolean results are often
     * slightly non-manifold and are still accepted.
     */
    bool validate(std::string* reason = nullptr) const;

    MeshBounds bounds() const;
    Extents extents() const;

    /**
     * @brief Area-weighted centroid of the surface
     */
    gp_Pnt centroid() const;

    /**
     * @brief Signed enclosed volume (divergence theorem)
     */
    double volume() const;
    double surfaceArea() const;

    TriangleMesh transformed(const gp_Trsf& trsf) const;

private:
    std::vector<gp_Pnt> vertices_;
    std::vector<Triangle> triangles_;
};

} // namespace partcad::core::mesh

#endif // PARTCAD_CORE_MESH_TRIANGLEMESH_H
